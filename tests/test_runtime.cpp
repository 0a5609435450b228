#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "sos/sandbox/docker_runtime.hpp"
#include "sos/sandbox/native_runtime.hpp"
#include "sos/sandbox/process.hpp"
#include "sos/sandbox/retrying_runtime.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace {

bool contains(const std::vector<std::string> &args, const std::string &value) {
  return std::find(args.begin(), args.end(), value) != args.end();
}

bool has_pair(const std::vector<std::string> &args, const std::string &flag,
              const std::string &value) {
  for (std::size_t i = 0; i + 1 < args.size(); ++i) {
    if (args[i] == flag && args[i + 1] == value) {
      return true;
    }
  }
  return false;
}

sos::sandbox::ContainerHandle docker_handle() {
  return sos::sandbox::ContainerHandle{
      .id = "c0ffee", .name = "sos-sbx", .sandbox_id = "sbx", .workdir = ""};
}

sos::sandbox::DockerRuntimeOptions fast_docker_options() {
  sos::sandbox::DockerRuntimeOptions options;
  options.start_poll_attempts = 3;
  options.start_poll_interval = std::chrono::milliseconds(1);
  return options;
}

sos::sandbox::ProcessResult process_result(const int exit_code, const std::string &stdout_text,
                                           const std::string &stderr_text = "") {
  sos::sandbox::ProcessResult result;
  result.exit_code = exit_code;
  result.stdout_text = stdout_text;
  result.stderr_text = stderr_text;
  return result;
}

} // namespace

void register_runtime_tests(std::vector<sos::tests::TestCase> &tests) {
  using sos::tests::require;
  namespace sb = sos::sandbox;
  using sos::common::ErrorCode;

  tests.push_back({"process_run_captures_streams", [] {
                     auto ran = sb::run_process({"/bin/sh", "-c", "echo out; echo err >&2"});
                     require(ran.ok(), ran.error());
                     require(ran.value().stdout_text == "out\n", "stdout captured");
                     require(ran.value().stderr_text == "err\n", "stderr captured");
                     require(ran.value().exit_code == 0, "exit 0");
                   }});

  tests.push_back({"process_run_reports_failures", [] {
                     auto failed = sb::run_process({"/bin/sh", "-c", "exit 3"});
                     require(failed.code() == ErrorCode::Runtime,
                             "non-zero exit is a failure by default");
                     auto allowed = sb::run_process({"/bin/sh", "-c", "exit 3"},
                                                    sb::ProcessOptions{.allow_failure = true});
                     require(allowed.ok() && allowed.value().exit_code == 3,
                             "allow_failure returns the exit code");
                     auto missing = sb::run_process({"/definitely/not/a/binary"});
                     require(!missing.ok(), "missing binary fails");
                   }});

  tests.push_back({"process_run_kills_on_timeout", [] {
                     const auto begin = std::chrono::steady_clock::now();
                     auto slow = sb::run_process(
                         {"/bin/sh", "-c", "sleep 10"},
                         sb::ProcessOptions{.allow_failure = true,
                                            .timeout = std::chrono::milliseconds(150)});
                     require(slow.ok(), slow.error());
                     require(slow.value().timed_out, "timed_out flag set");
                     require(std::chrono::steady_clock::now() - begin < std::chrono::seconds(5),
                             "child should be killed promptly");
                   }});

  tests.push_back({"docker_create_args", [] {
                     sb::DockerRuntimeOptions options;
                     options.network = "none";
                     options.memory_limit = "512m";
                     options.cpu_limit = "1.5";
                     options.pids_limit = 128;
                     options.env = {"LANG=C", "broken", ""};
                     options.workdir = "/work";
                     const auto args = sb::build_docker_create_args(
                         options, sb::ContainerSpec{.sandbox_id = "abc",
                                                    .image = "ubuntu:22.04",
                                                    .setup_commands = {}});
                     require(args.front() == "create", "create subcommand");
                     require(contains(args, "--interactive"), "stdin kept open");
                     require(has_pair(args, "--name", "sos-abc"), "container name");
                     require(has_pair(args, "--label", "sos.id=abc"), "sandbox label");
                     require(has_pair(args, "--network", "none"), "network");
                     require(has_pair(args, "--memory", "512m"), "memory limit");
                     require(has_pair(args, "--cpus", "1.5"), "cpu limit");
                     require(has_pair(args, "--pids-limit", "128"), "pids limit");
                     require(has_pair(args, "--env", "LANG=C"), "env entry");
                     require(!contains(args, "broken"), "malformed env skipped");
                     require(has_pair(args, "--workdir", "/work"), "workdir");
                     require(args[args.size() - 2] == "ubuntu:22.04" && args.back() == "/bin/bash",
                             "image then shell close the argv");
                   }});

  tests.push_back({"docker_container_name_is_bounded", [] {
                     const auto name = sb::container_name_for("sos-", std::string(100, 'a'));
                     require(name.size() == 63, "docker names are capped");
                   }});

  tests.push_back({"docker_create_pulls_missing_image", [] {
                     auto runner = std::make_shared<sos::testing::FakeDockerRunner>();
                     runner->push_result("image", process_result(1, "", "No such image"));
                     sb::DockerRuntime runtime(fast_docker_options(), runner);
                     auto created = runtime.create_container(
                         sb::ContainerSpec{.sandbox_id = "sbx", .image = "alpine",
                                           .setup_commands = {}});
                     require(created.ok(), created.error());
                     require(created.value().id == "c0ffee", "id from docker create");
                     require(runner->count("pull") == 1, "image should be pulled");

                     auto again = runtime.create_container(
                         sb::ContainerSpec{.sandbox_id = "sbx2", .image = "alpine",
                                           .setup_commands = {}});
                     require(again.ok(), again.error());
                     require(runner->count("pull") == 1, "present image is not pulled");
                   }});

  tests.push_back({"docker_create_failures", [] {
                     auto runner = std::make_shared<sos::testing::FakeDockerRunner>();
                     sb::DockerRuntime runtime(fast_docker_options(), runner);
                     auto blank = runtime.create_container(
                         sb::ContainerSpec{.sandbox_id = "sbx", .image = " ",
                                           .setup_commands = {}});
                     require(blank.code() == ErrorCode::InvalidArgument, "blank image");
                     require(runner->calls().empty(), "docker not invoked");

                     runner->push_result("create", process_result(125, "", "bad flag"));
                     auto failed = runtime.create_container(
                         sb::ContainerSpec{.sandbox_id = "sbx", .image = "alpine",
                                           .setup_commands = {}});
                     require(failed.code() == ErrorCode::Runtime, "create error is Runtime");
                   }});

  tests.push_back({"docker_start_polls_until_running", [] {
                     auto runner = std::make_shared<sos::testing::FakeDockerRunner>();
                     runner->push_result("inspect", process_result(0, "false\n"));
                     runner->push_result("inspect", process_result(0, "false\n"));
                     sb::DockerRuntime runtime(fast_docker_options(), runner);
                     auto started = runtime.start_container(docker_handle());
                     require(started.ok(), started.error());
                     require(runner->count("inspect") == 3, "polled until running");

                     for (int i = 0; i < 3; ++i) {
                       runner->push_result("inspect", process_result(0, "false\n"));
                     }
                     runner->push_result("logs", process_result(0, "", "exec format error"));
                     auto stuck = runtime.start_container(docker_handle());
                     require(stuck.code() == ErrorCode::Runtime, "never running is an error");
                     require(stuck.error().find("exec format error") != std::string::npos,
                             "container logs included: " + stuck.error());
                   }});

  tests.push_back({"docker_exec_standalone", [] {
                     auto runner = std::make_shared<sos::testing::FakeDockerRunner>();
                     sb::DockerRuntime runtime(fast_docker_options(), runner);
                     runner->push_result("exec", process_result(2, "partial\n", "oops\n"));
                     auto ran = runtime.exec_standalone(docker_handle(), "make test",
                                                        std::chrono::seconds(5));
                     require(ran.ok(), ran.error());
                     require(ran.value().exit_code == 2 && ran.value().stdout_text == "partial\n",
                             "command exit status is a result");
                     const auto call = runner->calls().back();
                     require(call == std::vector<std::string>(
                                         {"exec", "c0ffee", "/bin/bash", "-c", "make test"}),
                             "exec argv");

                     runner->push_result("exec", process_result(
                                                     1, "", "Error response from daemon: "
                                                            "container c0ffee is not running"));
                     auto dead = runtime.exec_standalone(docker_handle(), "ls",
                                                         std::chrono::seconds(5));
                     require(dead.code() == ErrorCode::Runtime, "daemon errors are failures");
                   }});

  tests.push_back({"docker_stop_and_remove_tolerate_missing", [] {
                     auto runner = std::make_shared<sos::testing::FakeDockerRunner>();
                     sb::DockerRuntime runtime(fast_docker_options(), runner);
                     runner->push_result("stop", process_result(1, "",
                                                                "Error: No such container: c0ffee"));
                     require(runtime.stop_container(docker_handle()).ok(), "missing on stop is ok");
                     runner->push_result("rm", process_result(1, "",
                                                              "Error: No such container: c0ffee"));
                     require(runtime.remove_container(docker_handle()).ok(),
                             "missing on remove is ok");

                     runner->push_result("rm", process_result(1, "", "permission denied"));
                     auto denied = runtime.remove_container(docker_handle());
                     require(denied.code() == ErrorCode::Runtime, "other errors surface");
                     require(has_pair(runner->calls().front(), "--time", "1"), "short stop grace");
                   }});

  tests.push_back({"retrying_runtime_retries_start_once", [] {
                     auto fake = std::make_shared<sos::testing::FakeRuntime>();
                     sb::RetryingRuntime runtime(fake, 1, std::chrono::milliseconds(1));
                     const sb::ContainerHandle handle{
                         .id = "fake-1", .name = "sos-sbx", .sandbox_id = "sbx", .workdir = ""};

                     fake->fail_start = 1;
                     auto recovered = runtime.start_container(handle);
                     require(recovered.ok(), recovered.error());
                     require(fake->start_calls.load() == 2, "one retry");

                     fake->fail_start = 2;
                     auto failed = runtime.start_container(handle);
                     require(failed.code() == ErrorCode::Runtime, "second failure surfaces");
                     require(fake->start_calls.load() == 4, "no more than one retry");
                     require(failed.error().rfind("start (sandbox sbx): ", 0) == 0,
                             "operation context prefix: " + failed.error());
                   }});

  tests.push_back({"retrying_runtime_never_repeats_create_or_exec", [] {
                     sos::testing::ScopedRecordingObserver scoped;
                     auto fake = std::make_shared<sos::testing::FakeRuntime>();
                     sb::RetryingRuntime runtime(fake, 1, std::chrono::milliseconds(1));
                     fake->fail_create = 1;
                     auto created = runtime.create_container(
                         sb::ContainerSpec{.sandbox_id = "sbx", .image = "alpine",
                                           .setup_commands = {}});
                     require(!created.ok(), "create failure surfaces");
                     require(fake->create_calls.load() == 1, "create is not retried");
                     require(created.error().rfind("create (sandbox sbx): ", 0) == 0,
                             "create context prefix");

                     fake->set_standalone_handler([](const std::string &) {
                       return sos::common::Result<sb::CommandResult>::failure(ErrorCode::Runtime,
                                                                              "gone");
                     });
                     auto ran = runtime.exec_standalone(
                         sb::ContainerHandle{.id = "fake-1", .name = "", .sandbox_id = "sbx",
                                             .workdir = ""},
                         "ls", std::chrono::seconds(1));
                     require(!ran.ok() && fake->standalone_calls.load() == 1,
                             "standalone exec is not retried");
                     require(runtime.name() == "fake", "name of the wrapped runtime");
                   }});

  tests.push_back({"retrying_runtime_retries_attach_stop_remove", [] {
                     auto fake = std::make_shared<sos::testing::FakeRuntime>();
                     sb::RetryingRuntime runtime(fake, 1, std::chrono::milliseconds(1));
                     const sb::ContainerHandle handle{
                         .id = "fake-1", .name = "sos-sbx", .sandbox_id = "sbx", .workdir = ""};
                     fake->fail_attach = 1;
                     fake->fail_stop = 1;
                     fake->fail_remove = 1;
                     require(runtime.attach(handle).ok(), "attach recovers");
                     require(runtime.stop_container(handle).ok(), "stop recovers");
                     require(runtime.remove_container(handle).ok(), "remove recovers");
                     require(fake->attach_calls.load() == 2 && fake->stop_calls.load() == 2 &&
                                 fake->remove_calls.load() == 2,
                             "each retried once");
                   }});

  tests.push_back({"native_runtime_lifecycle", [] {
                     sos::testing::TempDir root;
                     sb::NativeRuntime runtime(sb::NativeRuntimeOptions{.root = root.path(),
                                                                        .shell = "/bin/bash"});
                     auto created = runtime.create_container(
                         sb::ContainerSpec{.sandbox_id = "0123456789", .image = "host",
                                           .setup_commands = {}});
                     require(created.ok(), created.error());
                     const auto handle = created.value();
                     require(std::filesystem::is_directory(handle.workdir), "work dir created");
                     require(runtime.start_container(handle).ok(), "start checks the dir");

                     auto ran = runtime.exec_standalone(handle, "pwd; echo err >&2; exit 4",
                                                        std::chrono::seconds(5));
                     require(ran.ok(), ran.error());
                     require(ran.value().stdout_text == handle.workdir + "\n",
                             "runs in the work dir: " + ran.value().stdout_text);
                     require(ran.value().stderr_text == "err\n", "stderr");
                     require(ran.value().exit_code == 4, "exit code");

                     require(runtime.stop_container(handle).ok(), "stop");
                     require(runtime.remove_container(handle).ok(), "remove");
                     require(!std::filesystem::exists(handle.workdir), "work dir removed");
                     require(runtime.remove_container(handle).ok(), "second remove is ok");
                     require(runtime.start_container(handle).code() == ErrorCode::Runtime,
                             "missing dir cannot start");
                   }});

  tests.push_back({"native_runtime_standalone_timeout", [] {
                     sos::testing::TempDir root;
                     sb::NativeRuntime runtime(sb::NativeRuntimeOptions{.root = root.path(),
                                                                        .shell = "/bin/bash"});
                     auto handle = runtime.create_container(
                         sb::ContainerSpec{.sandbox_id = "timeout", .image = "host",
                                           .setup_commands = {}});
                     require(handle.ok(), handle.error());
                     auto slow = runtime.exec_standalone(handle.value(), "sleep 10",
                                                         std::chrono::milliseconds(150));
                     require(slow.code() == ErrorCode::Runtime, "timeout is a runtime failure");
                   }});
}
