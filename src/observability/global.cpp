#include "sos/observability/global.hpp"

#include <mutex>

namespace sos::observability {

namespace {

std::mutex g_observer_mutex;
std::shared_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::shared_ptr<IObserver> previous;
  {
    std::lock_guard<std::mutex> lock(g_observer_mutex);
    previous = std::move(g_observer);
    g_observer = std::move(observer);
  }
  if (previous != nullptr) {
    previous->flush();
  }
}

std::shared_ptr<IObserver> get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer;
}

void record_event(const ObserverEvent &event) {
  if (auto observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_state_change(const std::string &sandbox_id, const std::string &from,
                         const std::string &to, const std::string &detail) {
  record_event(
      SandboxStateEvent{.sandbox_id = sandbox_id, .from = from, .to = to, .detail = detail});
}

void record_command(const std::string &sandbox_id, const std::string &mode, const int exit_code,
                    const std::chrono::milliseconds duration) {
  record_event(CommandEvent{
      .sandbox_id = sandbox_id, .mode = mode, .exit_code = exit_code, .duration = duration});
  record_metric(ExecLatencyMetric{.mode = mode, .latency = duration});
}

void record_admission(const std::string &action, const std::size_t in_use,
                      const std::size_t capacity) {
  record_event(AdmissionEvent{.action = action, .in_use = in_use, .capacity = capacity});
  record_metric(ActiveSandboxesMetric{.count = in_use});
}

void record_runtime_retry(const std::string &operation, const std::string &sandbox_id,
                          const std::uint32_t attempt, const std::string &error) {
  record_event(RuntimeRetryEvent{
      .operation = operation, .sandbox_id = sandbox_id, .attempt = attempt, .error = error});
}

void record_server(const std::string &action, const std::string &detail) {
  record_event(ServerEvent{.action = action, .detail = detail});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace sos::observability
