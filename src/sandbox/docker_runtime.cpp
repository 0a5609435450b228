#include "sos/sandbox/docker_runtime.hpp"

#include "sos/common/fs.hpp"

#include <thread>

namespace sos::sandbox {

namespace {

constexpr const char *kDaemonErrorPrefix = "Error response from daemon";

bool is_missing_container(const ProcessResult &result) {
  return result.stderr_text.find("No such container") != std::string::npos;
}

std::string failure_detail(const ProcessResult &result) {
  const std::string detail = common::trim(result.stderr_text);
  return detail.empty() ? "exit code " + std::to_string(result.exit_code) : detail;
}

} // namespace

std::string container_name_for(const std::string &prefix, const std::string &sandbox_id) {
  std::string name = prefix + sandbox_id;
  if (name.size() > 63) {
    name.resize(63);
  }
  return name;
}

std::vector<std::string> build_docker_create_args(const DockerRuntimeOptions &options,
                                                   const ContainerSpec &spec) {
  std::vector<std::string> args = {"create", "--interactive", "--name",
                                   container_name_for(options.container_prefix, spec.sandbox_id)};
  args.push_back("--label");
  args.push_back("sos.sandbox=1");
  args.push_back("--label");
  args.push_back("sos.id=" + spec.sandbox_id);

  if (!common::trim(options.network).empty()) {
    args.push_back("--network");
    args.push_back(options.network);
  }
  args.push_back("--security-opt");
  args.push_back("no-new-privileges");

  args.push_back("--env");
  args.push_back("TERM=dumb");
  for (const auto &entry : options.env) {
    if (common::trim(entry).empty() || entry.find('=') == std::string::npos) {
      continue;
    }
    args.push_back("--env");
    args.push_back(entry);
  }

  if (options.pids_limit > 0) {
    args.push_back("--pids-limit");
    args.push_back(std::to_string(options.pids_limit));
  }
  if (!common::trim(options.memory_limit).empty()) {
    args.push_back("--memory");
    args.push_back(options.memory_limit);
  }
  if (!common::trim(options.cpu_limit).empty()) {
    args.push_back("--cpus");
    args.push_back(options.cpu_limit);
  }
  if (!common::trim(options.workdir).empty()) {
    args.push_back("--workdir");
    args.push_back(options.workdir);
  }

  args.push_back(spec.image);
  args.push_back(options.shell);
  return args;
}

DockerRuntime::DockerRuntime(DockerRuntimeOptions options, std::shared_ptr<IDockerRunner> runner)
    : options_(std::move(options)), runner_(std::move(runner)) {}

DockerCommandOptions DockerRuntime::command_options(const bool allow_failure) const {
  return DockerCommandOptions{.allow_failure = allow_failure,
                              .timeout = options_.command_timeout};
}

common::Status DockerRuntime::ensure_image(const std::string &image) {
  auto inspect = runner_->run({"image", "inspect", "--format", "{{.Id}}", image},
                              command_options(true));
  if (!inspect.ok()) {
    return inspect.status();
  }
  if (inspect.value().exit_code == 0 || !options_.pull_missing_images) {
    return common::Status::success();
  }

  auto pull = runner_->run({"pull", image}, DockerCommandOptions{.allow_failure = false,
                                                                 .timeout = options_.pull_timeout});
  if (!pull.ok()) {
    return common::Status::error(common::ErrorCode::Runtime,
                                 "failed to pull image " + image + ": " + pull.error());
  }
  return common::Status::success();
}

common::Result<ContainerHandle> DockerRuntime::create_container(const ContainerSpec &spec) {
  if (common::trim(spec.image).empty()) {
    return common::Result<ContainerHandle>::failure(common::ErrorCode::InvalidArgument,
                                                    "image must not be empty");
  }
  if (auto image = ensure_image(spec.image); !image.ok()) {
    return common::Result<ContainerHandle>::failure(image);
  }

  auto created = runner_->run(build_docker_create_args(options_, spec), command_options(false));
  if (!created.ok()) {
    return common::Result<ContainerHandle>::failure(common::ErrorCode::Runtime, created.error());
  }

  const std::string id = common::trim(created.value().stdout_text);
  if (id.empty()) {
    return common::Result<ContainerHandle>::failure(common::ErrorCode::Runtime,
                                                    "docker create returned no container id");
  }
  return common::Result<ContainerHandle>::success(ContainerHandle{
      .id = id,
      .name = container_name_for(options_.container_prefix, spec.sandbox_id),
      .sandbox_id = spec.sandbox_id,
      .workdir = options_.workdir,
  });
}

common::Status DockerRuntime::start_container(const ContainerHandle &handle) {
  auto started = runner_->run({"start", handle.id}, command_options(false));
  if (!started.ok()) {
    return common::Status::error(common::ErrorCode::Runtime, started.error());
  }

  for (std::uint32_t attempt = 0; attempt < options_.start_poll_attempts; ++attempt) {
    auto state = inspect_container_state(handle.id);
    if (!state.ok()) {
      return state.status();
    }
    if (state.value().running) {
      return common::Status::success();
    }
    std::this_thread::sleep_for(options_.start_poll_interval);
  }

  std::string message = "container " + handle.name + " did not reach the running state";
  if (auto logs = runner_->run({"logs", "--tail", "50", handle.id}, command_options(true));
      logs.ok()) {
    const std::string output =
        common::trim(logs.value().stdout_text + "\n" + logs.value().stderr_text);
    if (!output.empty()) {
      message += "; logs: " + output;
    }
  }
  return common::Status::error(common::ErrorCode::Runtime, message);
}

common::Result<std::unique_ptr<IShellStream>> DockerRuntime::attach(const ContainerHandle &handle) {
  auto argv = runner_->command_prefix();
  argv.insert(argv.end(), {"attach", "--sig-proxy=false", handle.id});
  auto child = ChildProcess::spawn(argv);
  if (!child.ok()) {
    return common::Result<std::unique_ptr<IShellStream>>::failure(common::ErrorCode::Runtime,
                                                                  child.error());
  }
  return common::Result<std::unique_ptr<IShellStream>>::success(
      std::make_unique<ProcessShellStream>(std::move(child.value())));
}

common::Result<CommandResult> DockerRuntime::exec_standalone(const ContainerHandle &handle,
                                                             const std::string &command,
                                                             const std::chrono::milliseconds timeout) {
  auto ran = runner_->run({"exec", handle.id, options_.shell, "-c", command},
                          DockerCommandOptions{.allow_failure = true, .timeout = timeout});
  if (!ran.ok()) {
    return common::Result<CommandResult>::failure(common::ErrorCode::Runtime, ran.error());
  }
  auto &process = ran.value();
  if (process.timed_out) {
    return common::Result<CommandResult>::failure(
        common::ErrorCode::Runtime,
        "standalone command timed out after " + std::to_string(timeout.count()) + "ms");
  }
  if (process.exit_code != 0 && common::starts_with(process.stderr_text, kDaemonErrorPrefix)) {
    return common::Result<CommandResult>::failure(common::ErrorCode::Runtime,
                                                  common::trim(process.stderr_text));
  }
  return common::Result<CommandResult>::success(CommandResult{
      .stdout_text = std::move(process.stdout_text),
      .stderr_text = std::move(process.stderr_text),
      .exit_code = process.exit_code,
  });
}

common::Status DockerRuntime::stop_container(const ContainerHandle &handle) {
  auto stopped = runner_->run({"stop", "--time", "1", handle.id}, command_options(true));
  if (!stopped.ok()) {
    return stopped.status();
  }
  if (stopped.value().exit_code != 0 && !is_missing_container(stopped.value())) {
    return common::Status::error(common::ErrorCode::Runtime,
                                 "docker stop failed: " + failure_detail(stopped.value()));
  }
  return common::Status::success();
}

common::Status DockerRuntime::remove_container(const ContainerHandle &handle) {
  auto removed = runner_->run({"rm", "-f", handle.id}, command_options(true));
  if (!removed.ok()) {
    return removed.status();
  }
  if (removed.value().exit_code != 0 && !is_missing_container(removed.value())) {
    return common::Status::error(common::ErrorCode::Runtime,
                                 "docker rm failed: " + failure_detail(removed.value()));
  }
  return common::Status::success();
}

common::Result<DockerRuntime::ContainerState>
DockerRuntime::inspect_container_state(const std::string &id) {
  auto inspect = runner_->run({"inspect", "-f", "{{.State.Running}}", id}, command_options(true));
  if (!inspect.ok()) {
    return common::Result<ContainerState>::failure(inspect.status());
  }
  if (inspect.value().exit_code != 0) {
    return common::Result<ContainerState>::success(
        ContainerState{.exists = false, .running = false});
  }
  const bool running = common::to_lower(common::trim(inspect.value().stdout_text)) == "true";
  return common::Result<ContainerState>::success(
      ContainerState{.exists = true, .running = running});
}

} // namespace sos::sandbox
