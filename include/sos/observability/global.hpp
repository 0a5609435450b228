#pragma once

#include "sos/observability/observer.hpp"

#include <memory>

namespace sos::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
[[nodiscard]] std::shared_ptr<IObserver> get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_state_change(const std::string &sandbox_id, const std::string &from,
                         const std::string &to, const std::string &detail = "");
void record_command(const std::string &sandbox_id, const std::string &mode, int exit_code,
                    std::chrono::milliseconds duration);
void record_admission(const std::string &action, std::size_t in_use, std::size_t capacity);
void record_runtime_retry(const std::string &operation, const std::string &sandbox_id,
                          std::uint32_t attempt, const std::string &error);
void record_server(const std::string &action, const std::string &detail = "");
void record_error(const std::string &component, const std::string &message);

} // namespace sos::observability
