#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "sos/sandbox/factory.hpp"
#include "sos/sandbox/orchestrator.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

namespace sb = sos::sandbox;

struct NativeStack {
  sos::testing::TempDir root;
  std::unique_ptr<sb::Orchestrator> orchestrator;

  NativeStack() {
    auto config = sos::testing::mock_config();
    config.runtime.native_root = root.path().string();
    auto runtime = sb::create_runtime(config);
    if (!runtime.ok()) {
      throw std::runtime_error(runtime.error());
    }
    auto options = sb::orchestrator_options(config);
    options.max_lifetime = std::chrono::seconds(0);
    orchestrator = std::make_unique<sb::Orchestrator>(runtime.value(), options);
  }

  ~NativeStack() {
    if (orchestrator != nullptr) {
      orchestrator->shutdown();
    }
  }

  std::string running(std::vector<std::string> setup = {}) {
    auto id = orchestrator->create(sb::SandboxSpec{.image = "host",
                                                   .setup_commands = std::move(setup)});
    if (!id.ok()) {
      throw std::runtime_error(id.error());
    }
    if (auto started = orchestrator->start(id.value()); !started.ok()) {
      throw std::runtime_error(started.error());
    }
    return id.value();
  }

  sb::CommandResult run(const std::string &id, const std::string &command,
                        const sb::ExecMode mode = sb::ExecMode::Session) {
    auto result = orchestrator->exec(
        id, sb::ExecRequest{.command = command, .mode = mode, .timeout = {}});
    if (!result.ok()) {
      throw std::runtime_error(command + ": " + result.error());
    }
    return result.value();
  }
};

} // namespace

void register_native_integration_tests(std::vector<sos::tests::TestCase> &tests) {
  using sos::tests::require;
  using sos::common::ErrorCode;

  tests.push_back({"native_session_keeps_directory_and_env", [] {
                     NativeStack stack;
                     const auto id = stack.running();
                     require(stack.run(id, "cd /tmp").exit_code == 0, "cd");
                     require(stack.run(id, "pwd").stdout_text == "/tmp", "cwd persists");
                     require(stack.run(id, "export GREETING=hello").exit_code == 0, "export");
                     require(stack.run(id, "echo \"$GREETING world\"").stdout_text ==
                                 "hello world",
                             "env persists");
                   }});

  tests.push_back({"native_standalone_is_isolated_from_session_state", [] {
                     NativeStack stack;
                     const auto id = stack.running();
                     const auto home = stack.run(id, "pwd").stdout_text;
                     require(stack.run(id, "echo data > file.txt && cd /tmp").exit_code == 0,
                             "write file");
                     const auto cat =
                         stack.run(id, "cat file.txt", sb::ExecMode::Standalone);
                     require(cat.stdout_text == "data", "standalone sees the work dir");
                     const auto pwd = stack.run(id, "pwd", sb::ExecMode::Standalone);
                     require(pwd.stdout_text == home, "standalone ignores the session cwd");
                     require(stack.run(id, "pwd").stdout_text == "/tmp",
                             "session cwd unaffected by standalone");
                   }});

  tests.push_back({"native_exit_codes_and_stderr", [] {
                     NativeStack stack;
                     const auto id = stack.running();
                     const auto failed = stack.run(id, "echo oops >&2; false");
                     require(failed.exit_code == 1, "false exits 1");
                     require(failed.stderr_text == "oops", "stderr captured");
                     require(stack.run(id, "exit 3").exit_code == 3, "exit reports status");
                     require(stack.run(id, "echo alive").stdout_text == "alive",
                             "session survives exit");
                     const auto multi = stack.run(id, "printf 'a\\nb\\n\\n'");
                     require(multi.stdout_text == "a\nb", "only trailing newlines trimmed");
                   }});

  tests.push_back({"native_setup_commands_run_first", [] {
                     NativeStack stack;
                     const auto id = stack.running({"echo ready > setup.txt", "mkdir -p work"});
                     require(stack.run(id, "cat setup.txt").stdout_text == "ready",
                             "setup output visible");
                     require(stack.run(id, "test -d work").exit_code == 0, "setup dir exists");

                     auto broken = stack.orchestrator->create(
                         sb::SandboxSpec{.image = "host", .setup_commands = {"exit 7"}});
                     auto started = stack.orchestrator->start(broken.value());
                     require(started.code() == ErrorCode::SetupFailed, "setup failure");
                     require(stack.orchestrator->describe(broken.value()).value().state ==
                                 sb::SandboxState::Failed,
                             "failed sandbox");
                   }});

  tests.push_back({"native_timeout_fails_sandbox_and_stop_cleans_up", [] {
                     NativeStack stack;
                     const auto id = stack.running();
                     auto hung = stack.orchestrator->exec(
                         id, sb::ExecRequest{.command = "sleep 30",
                                             .mode = sb::ExecMode::Session,
                                             .timeout = std::chrono::milliseconds(300)});
                     require(hung.code() == ErrorCode::SessionTimeout, "timeout");
                     require(stack.orchestrator->describe(id).value().state ==
                                 sb::SandboxState::Failed,
                             "failed after timeout");

                     const auto other = stack.running();
                     const auto workdir = stack.run(other, "pwd").stdout_text;
                     require(std::filesystem::is_directory(workdir), "work dir exists");
                     require(stack.orchestrator->stop(other).ok(), "stop");
                     require(!std::filesystem::exists(workdir), "work dir removed on stop");
                   }});
}
