#pragma once

#include "sos/sandbox/docker.hpp"
#include "sos/sandbox/runtime.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace sos::sandbox {

struct DockerRuntimeOptions {
  std::string shell = "/bin/bash";
  std::string container_prefix = "sos-";
  std::string network;
  std::string memory_limit;
  std::string cpu_limit;
  std::uint32_t pids_limit = 0;
  std::vector<std::string> env;
  std::string workdir;
  bool pull_missing_images = true;
  std::chrono::milliseconds command_timeout{60'000};
  std::chrono::milliseconds pull_timeout{600'000};
  std::uint32_t start_poll_attempts = 6;
  std::chrono::milliseconds start_poll_interval{500};
};

[[nodiscard]] std::string container_name_for(const std::string &prefix,
                                             const std::string &sandbox_id);

/// `docker create` argv for a sandbox whose primary process is an
/// interactive-less shell reading commands from an open stdin.
[[nodiscard]] std::vector<std::string> build_docker_create_args(const DockerRuntimeOptions &options,
                                                                const ContainerSpec &spec);

class DockerRuntime final : public IContainerRuntime {
public:
  explicit DockerRuntime(DockerRuntimeOptions options,
                         std::shared_ptr<IDockerRunner> runner = std::make_shared<DockerCliRunner>());

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
  [[nodiscard]] std::string_view name() const override { return "docker"; }

private:
  struct ContainerState {
    bool exists = false;
    bool running = false;
  };

  [[nodiscard]] common::Status ensure_image(const std::string &image);
  [[nodiscard]] common::Result<ContainerState> inspect_container_state(const std::string &id);
  [[nodiscard]] DockerCommandOptions command_options(bool allow_failure) const;

  DockerRuntimeOptions options_;
  std::shared_ptr<IDockerRunner> runner_;
};

} // namespace sos::sandbox
