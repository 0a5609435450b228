#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace sos::observability {

struct SandboxStateEvent {
  std::string sandbox_id;
  std::string from;
  std::string to;
  std::string detail;
};

struct CommandEvent {
  std::string sandbox_id;
  std::string mode;
  int exit_code = 0;
  std::chrono::milliseconds duration{0};
};

struct AdmissionEvent {
  std::string action;
  std::size_t in_use = 0;
  std::size_t capacity = 0;
};

struct RuntimeRetryEvent {
  std::string operation;
  std::string sandbox_id;
  std::uint32_t attempt = 0;
  std::string error;
};

struct ServerEvent {
  std::string action;
  std::string detail;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<SandboxStateEvent, CommandEvent, AdmissionEvent,
                                   RuntimeRetryEvent, ServerEvent, ErrorEvent>;

struct RequestLatencyMetric {
  std::string route;
  int status = 0;
  std::chrono::milliseconds latency{0};
};

struct ExecLatencyMetric {
  std::string mode;
  std::chrono::milliseconds latency{0};
};

struct ActiveSandboxesMetric {
  std::uint64_t count = 0;
};

struct AdmissionWaitersMetric {
  std::uint64_t depth = 0;
};

using ObserverMetric = std::variant<RequestLatencyMetric, ExecLatencyMetric,
                                    ActiveSandboxesMetric, AdmissionWaitersMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace sos::observability
