#include "sos/sandbox/native_runtime.hpp"

#include "sos/common/fs.hpp"

namespace sos::sandbox {

NativeRuntime::NativeRuntime(NativeRuntimeOptions options) : options_(std::move(options)) {}

std::filesystem::path NativeRuntime::root() const {
  if (!options_.root.empty()) {
    return options_.root;
  }
  std::error_code ec;
  const auto tmp = std::filesystem::temp_directory_path(ec);
  return (ec ? std::filesystem::path("/tmp") : tmp) / "sos-native";
}

common::Result<ContainerHandle> NativeRuntime::create_container(const ContainerSpec &spec) {
  if (auto parent = common::ensure_dir(root()); !parent.ok()) {
    return common::Result<ContainerHandle>::failure(common::ErrorCode::Runtime, parent.error());
  }
  auto dir = common::make_unique_dir(root(), spec.sandbox_id.substr(0, 8) + "-");
  if (!dir.ok()) {
    return common::Result<ContainerHandle>::failure(common::ErrorCode::Runtime, dir.error());
  }
  const std::string path = dir.value().string();
  return common::Result<ContainerHandle>::success(ContainerHandle{
      .id = path,
      .name = "native-" + spec.sandbox_id,
      .sandbox_id = spec.sandbox_id,
      .workdir = path,
  });
}

common::Status NativeRuntime::start_container(const ContainerHandle &handle) {
  std::error_code ec;
  if (!std::filesystem::is_directory(handle.id, ec)) {
    return common::Status::error(common::ErrorCode::Runtime,
                                 "work directory is missing: " + handle.id);
  }
  return common::Status::success();
}

common::Result<std::unique_ptr<IShellStream>> NativeRuntime::attach(const ContainerHandle &handle) {
  auto child = ChildProcess::spawn({options_.shell}, handle.id);
  if (!child.ok()) {
    return common::Result<std::unique_ptr<IShellStream>>::failure(common::ErrorCode::Runtime,
                                                                  child.error());
  }
  return common::Result<std::unique_ptr<IShellStream>>::success(
      std::make_unique<ProcessShellStream>(std::move(child.value())));
}

common::Result<CommandResult> NativeRuntime::exec_standalone(const ContainerHandle &handle,
                                                             const std::string &command,
                                                             const std::chrono::milliseconds timeout) {
  auto ran = run_process({options_.shell, "-c", command},
                         ProcessOptions{.allow_failure = true,
                                        .timeout = timeout,
                                        .working_dir = handle.id});
  if (!ran.ok()) {
    return common::Result<CommandResult>::failure(common::ErrorCode::Runtime, ran.error());
  }
  auto &process = ran.value();
  if (process.timed_out) {
    return common::Result<CommandResult>::failure(
        common::ErrorCode::Runtime,
        "standalone command timed out after " + std::to_string(timeout.count()) + "ms");
  }
  return common::Result<CommandResult>::success(CommandResult{
      .stdout_text = std::move(process.stdout_text),
      .stderr_text = std::move(process.stderr_text),
      .exit_code = process.exit_code,
  });
}

common::Status NativeRuntime::stop_container(const ContainerHandle &) {
  // The only process is the session shell, which its session owns.
  return common::Status::success();
}

common::Status NativeRuntime::remove_container(const ContainerHandle &handle) {
  std::error_code ec;
  std::filesystem::remove_all(handle.id, ec);
  if (ec) {
    return common::Status::error(common::ErrorCode::Runtime,
                                 "failed to remove " + handle.id + ": " + ec.message());
  }
  return common::Status::success();
}

} // namespace sos::sandbox
