#include "sos/sandbox/factory.hpp"

#include "sos/common/fs.hpp"
#include "sos/sandbox/docker_runtime.hpp"
#include "sos/sandbox/native_runtime.hpp"
#include "sos/sandbox/retrying_runtime.hpp"

namespace sos::sandbox {

common::Result<std::shared_ptr<IContainerRuntime>> create_runtime(const config::Config &config) {
  using RuntimeResult = common::Result<std::shared_ptr<IContainerRuntime>>;
  const auto &runtime = config.runtime;
  const std::string kind = common::to_lower(common::trim(runtime.kind));

  std::shared_ptr<IContainerRuntime> inner;
  if (kind == "docker") {
    DockerRuntimeOptions options;
    options.shell = runtime.shell;
    options.container_prefix = runtime.container_prefix;
    options.network = runtime.network;
    options.memory_limit = runtime.memory_limit;
    options.cpu_limit = runtime.cpu_limit;
    options.pids_limit = runtime.pids_limit;
    options.env = runtime.env;
    options.workdir = config.sandbox.workdir;
    options.pull_missing_images = runtime.pull_missing_images;
    options.command_timeout = std::chrono::milliseconds(runtime.command_timeout_ms);
    options.pull_timeout = std::chrono::milliseconds(runtime.pull_timeout_ms);
    options.start_poll_attempts = runtime.start_poll_attempts;
    options.start_poll_interval = std::chrono::milliseconds(runtime.start_poll_interval_ms);
    inner = std::make_shared<DockerRuntime>(
        std::move(options), std::make_shared<DockerCliRunner>(runtime.docker_binary));
  } else if (kind == "native") {
    inner = std::make_shared<NativeRuntime>(
        NativeRuntimeOptions{.root = runtime.native_root, .shell = runtime.shell});
  } else {
    return RuntimeResult::failure(common::ErrorCode::InvalidArgument,
                                  "unsupported runtime.kind: " + runtime.kind);
  }

  return RuntimeResult::success(std::make_shared<RetryingRuntime>(
      std::move(inner), 1, std::chrono::milliseconds(runtime.retry_backoff_ms)));
}

OrchestratorOptions orchestrator_options(const config::Config &config) {
  const auto &sandbox = config.sandbox;
  OrchestratorOptions options;
  options.max_sandboxes = sandbox.max_sandboxes;
  options.default_image = sandbox.default_image;
  options.admission_wait = std::chrono::milliseconds(sandbox.admission_wait_ms);
  options.exec_timeout = std::chrono::milliseconds(sandbox.exec_timeout_ms);
  options.standalone_timeout = std::chrono::milliseconds(sandbox.standalone_timeout_ms);
  options.max_lifetime = std::chrono::seconds(sandbox.max_lifetime_secs);
  options.reap_interval = std::chrono::seconds(sandbox.reap_interval_secs);
  options.trajectory_max_records = sandbox.trajectory_max_records;
  options.session.init_timeout = std::chrono::milliseconds(sandbox.session_init_timeout_ms);
  options.session.probe_timeout = std::chrono::milliseconds(sandbox.probe_timeout_ms);
  return options;
}

} // namespace sos::sandbox
