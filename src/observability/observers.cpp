#include "sos/observability/observers.hpp"

#include <iostream>
#include <type_traits>

namespace sos::observability {

void LogObserver::write(const char *level, const std::string &message) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::cerr << "[" << level << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, SandboxStateEvent>) {
          std::string line = "sandbox.state id=" + evt.sandbox_id + " " + evt.from + " -> " + evt.to;
          if (!evt.detail.empty()) {
            line += " (" + evt.detail + ")";
          }
          write(evt.to == "failed" ? "WARN" : "INFO", line);
        } else if constexpr (std::is_same_v<T, CommandEvent>) {
          write("INFO", "command.exec id=" + evt.sandbox_id + " mode=" + evt.mode +
                            " exit_code=" + std::to_string(evt.exit_code) +
                            " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, AdmissionEvent>) {
          const std::string line = "admission." + evt.action + " in_use=" +
                                   std::to_string(evt.in_use) + "/" +
                                   std::to_string(evt.capacity);
          if (evt.action == "rejected" || evt.action == "cancelled") {
            write("WARN", line);
          } else if (verbose_) {
            write("DEBUG", line);
          }
        } else if constexpr (std::is_same_v<T, RuntimeRetryEvent>) {
          write("WARN", "runtime.retry op=" + evt.operation + " id=" + evt.sandbox_id +
                            " attempt=" + std::to_string(evt.attempt) + " error=" + evt.error);
        } else if constexpr (std::is_same_v<T, ServerEvent>) {
          write("INFO", "server." + evt.action + (evt.detail.empty() ? "" : " " + evt.detail));
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          write("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  if (!verbose_) {
    return;
  }
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, RequestLatencyMetric>) {
          write("DEBUG", "metric.request route=" + m.route + " status=" + std::to_string(m.status) +
                             " latency_ms=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, ExecLatencyMetric>) {
          write("DEBUG", "metric.exec mode=" + m.mode +
                             " latency_ms=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, ActiveSandboxesMetric>) {
          write("DEBUG", "metric.active_sandboxes=" + std::to_string(m.count));
        } else if constexpr (std::is_same_v<T, AdmissionWaitersMetric>) {
          write("DEBUG", "metric.admission_waiters=" + std::to_string(m.depth));
        }
      },
      metric);
}

void MultiObserver::add(std::unique_ptr<IObserver> observer) {
  if (observer != nullptr) {
    observers_.push_back(std::move(observer));
  }
}

void MultiObserver::record_event(const ObserverEvent &event) {
  for (auto &observer : observers_) {
    observer->record_event(event);
  }
}

void MultiObserver::record_metric(const ObserverMetric &metric) {
  for (auto &observer : observers_) {
    observer->record_metric(metric);
  }
}

void MultiObserver::flush() {
  for (auto &observer : observers_) {
    observer->flush();
  }
}

} // namespace sos::observability
