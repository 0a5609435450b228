#include "sos/sandbox/retrying_runtime.hpp"

#include "sos/observability/global.hpp"

#include <thread>
#include <type_traits>

namespace sos::sandbox {

namespace {

template <typename R> R with_context(R result, std::string_view operation,
                                     const std::string &sandbox_id) {
  if (result.ok()) {
    return result;
  }
  const auto message = runtime_error_context(operation, sandbox_id, result.error());
  if constexpr (std::is_same_v<R, common::Status>) {
    return common::Status::error(result.code(), message);
  } else {
    return R::failure(result.code(), message);
  }
}

} // namespace

std::string runtime_error_context(const std::string_view operation, const std::string &sandbox_id,
                                  const std::string &message) {
  return std::string(operation) + " (sandbox " + sandbox_id + "): " + message;
}

RetryingRuntime::RetryingRuntime(std::shared_ptr<IContainerRuntime> inner,
                                 const std::uint32_t max_retries,
                                 const std::chrono::milliseconds backoff)
    : inner_(std::move(inner)), max_retries_(max_retries), backoff_(backoff) {}

template <typename Fn>
auto RetryingRuntime::with_retry(const std::string_view operation, const std::string &sandbox_id,
                                 Fn &&fn) -> decltype(fn()) {
  auto result = fn();
  for (std::uint32_t attempt = 1; attempt <= max_retries_; ++attempt) {
    if (result.ok() || result.code() != common::ErrorCode::Runtime) {
      break;
    }
    observability::record_runtime_retry(std::string(operation), sandbox_id, attempt,
                                        result.error());
    std::this_thread::sleep_for(backoff_ * (1U << (attempt - 1)));
    result = fn();
  }
  return with_context(std::move(result), operation, sandbox_id);
}

common::Result<ContainerHandle> RetryingRuntime::create_container(const ContainerSpec &spec) {
  return with_context(inner_->create_container(spec), "create", spec.sandbox_id);
}

common::Status RetryingRuntime::start_container(const ContainerHandle &handle) {
  return with_retry("start", handle.sandbox_id,
                    [&] { return inner_->start_container(handle); });
}

common::Result<std::unique_ptr<IShellStream>> RetryingRuntime::attach(const ContainerHandle &handle) {
  return with_retry("attach", handle.sandbox_id, [&] { return inner_->attach(handle); });
}

common::Result<CommandResult> RetryingRuntime::exec_standalone(const ContainerHandle &handle,
                                                               const std::string &command,
                                                               const std::chrono::milliseconds timeout) {
  return with_context(inner_->exec_standalone(handle, command, timeout), "exec",
                      handle.sandbox_id);
}

common::Status RetryingRuntime::stop_container(const ContainerHandle &handle) {
  return with_retry("stop", handle.sandbox_id, [&] { return inner_->stop_container(handle); });
}

common::Status RetryingRuntime::remove_container(const ContainerHandle &handle) {
  return with_retry("remove", handle.sandbox_id,
                    [&] { return inner_->remove_container(handle); });
}

} // namespace sos::sandbox
