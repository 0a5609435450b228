#pragma once

#include "sos/common/result.hpp"
#include "sos/sandbox/stream.hpp"
#include "sos/sandbox/types.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace sos::sandbox {

struct ContainerSpec {
  std::string sandbox_id;
  std::string image;
  std::vector<std::string> setup_commands;
};

struct ContainerHandle {
  std::string id;
  std::string name;
  std::string sandbox_id;
  // Directory the session starts in; empty means the shell's $HOME.
  std::string workdir;
};

/// Stateless adapter over a container engine. Every call is independent and
/// reports failures as Runtime errors carrying the operation and sandbox id.
class IContainerRuntime {
public:
  virtual ~IContainerRuntime() = default;

  [[nodiscard]] virtual common::Result<ContainerHandle>
  create_container(const ContainerSpec &spec) = 0;
  [[nodiscard]] virtual common::Status start_container(const ContainerHandle &handle) = 0;
  /// Binds to the container's primary shell.
  [[nodiscard]] virtual common::Result<std::unique_ptr<IShellStream>>
  attach(const ContainerHandle &handle) = 0;
  /// Fresh one-off shell process; exit status is a normal result.
  [[nodiscard]] virtual common::Result<CommandResult>
  exec_standalone(const ContainerHandle &handle, const std::string &command,
                  std::chrono::milliseconds timeout) = 0;
  [[nodiscard]] virtual common::Status stop_container(const ContainerHandle &handle) = 0;
  /// Removing a container that no longer exists succeeds.
  [[nodiscard]] virtual common::Status remove_container(const ContainerHandle &handle) = 0;

  [[nodiscard]] virtual std::string_view name() const = 0;
};

[[nodiscard]] std::string runtime_error_context(std::string_view operation,
                                                const std::string &sandbox_id,
                                                const std::string &message);

} // namespace sos::sandbox
