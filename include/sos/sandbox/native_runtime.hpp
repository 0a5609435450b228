#pragma once

#include "sos/sandbox/runtime.hpp"

#include <chrono>
#include <filesystem>
#include <string>

namespace sos::sandbox {

struct NativeRuntimeOptions {
  // Parent of the per-sandbox work directories; empty means the system temp dir.
  std::filesystem::path root;
  std::string shell = "/bin/bash";
};

/// Host shells in per-sandbox work directories. No isolation: meant for
/// development machines without a container engine and for tests.
class NativeRuntime final : public IContainerRuntime {
public:
  explicit NativeRuntime(NativeRuntimeOptions options = {});

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
  [[nodiscard]] std::string_view name() const override { return "native"; }

private:
  [[nodiscard]] std::filesystem::path root() const;

  NativeRuntimeOptions options_;
};

} // namespace sos::sandbox
