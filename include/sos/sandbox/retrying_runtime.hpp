#pragma once

#include "sos/sandbox/runtime.hpp"

#include <chrono>
#include <cstdint>
#include <memory>

namespace sos::sandbox {

/// Decorator giving idempotent runtime calls (start, attach, stop, remove) a
/// bounded number of extra attempts on Runtime errors, and prefixing every
/// failure with the operation and sandbox id. Create and standalone exec are
/// never repeated.
class RetryingRuntime final : public IContainerRuntime {
public:
  RetryingRuntime(std::shared_ptr<IContainerRuntime> inner, std::uint32_t max_retries = 1,
                  std::chrono::milliseconds backoff = std::chrono::milliseconds(250));

  [[nodiscard]] common::Result<ContainerHandle>
  create_container(const ContainerSpec &spec) override;
  [[nodiscard]] common::Status start_container(const ContainerHandle &handle) override;
  [[nodiscard]] common::Result<std::unique_ptr<IShellStream>>
  attach(const ContainerHandle &handle) override;
  [[nodiscard]] common::Result<CommandResult>
  exec_standalone(const ContainerHandle &handle, const std::string &command,
                  std::chrono::milliseconds timeout) override;
  [[nodiscard]] common::Status stop_container(const ContainerHandle &handle) override;
  [[nodiscard]] common::Status remove_container(const ContainerHandle &handle) override;
  [[nodiscard]] std::string_view name() const override { return inner_->name(); }

private:
  template <typename Fn>
  auto with_retry(std::string_view operation, const std::string &sandbox_id, Fn &&fn)
      -> decltype(fn());

  std::shared_ptr<IContainerRuntime> inner_;
  std::uint32_t max_retries_;
  std::chrono::milliseconds backoff_;
};

} // namespace sos::sandbox
