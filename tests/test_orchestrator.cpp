#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "sos/sandbox/orchestrator.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

namespace sb = sos::sandbox;

sos::testing::ShellReply shell_reply(const std::string &command) {
  if (command.rfind("sleep", 0) == 0) {
    return sos::testing::ShellReply{
        .stdout_text = "", .stderr_text = "", .exit_code = 0, .hang = true};
  }
  return sos::testing::ShellReply{
      .stdout_text = "out:" + command + "\n", .stderr_text = "", .exit_code = 0, .hang = false};
}

sb::OrchestratorOptions test_options(const std::size_t max_sandboxes = 2) {
  sb::OrchestratorOptions options;
  options.max_sandboxes = max_sandboxes;
  options.default_image = "alpine:3";
  options.exec_timeout = std::chrono::seconds(5);
  options.standalone_timeout = std::chrono::seconds(5);
  options.max_lifetime = std::chrono::seconds(0);
  options.stop_wait = std::chrono::seconds(5);
  options.session = sb::SessionOptions{.init_timeout = std::chrono::milliseconds(300),
                                       .probe_timeout = std::chrono::milliseconds(200),
                                       .write_timeout = std::chrono::milliseconds(300)};
  return options;
}

struct Harness {
  std::shared_ptr<sos::testing::FakeRuntime> runtime =
      std::make_shared<sos::testing::FakeRuntime>(shell_reply);
  std::unique_ptr<sb::Orchestrator> orchestrator;

  explicit Harness(sb::OrchestratorOptions options = test_options()) {
    orchestrator = std::make_unique<sb::Orchestrator>(runtime, std::move(options));
  }

  std::string running(const std::string &image = "alpine") {
    auto id = orchestrator->create(sb::SandboxSpec{.image = image, .setup_commands = {}});
    if (!id.ok()) {
      throw std::runtime_error(id.error());
    }
    if (auto started = orchestrator->start(id.value()); !started.ok()) {
      throw std::runtime_error(started.error());
    }
    return id.value();
  }

  sb::SandboxState state(const std::string &id) const {
    return orchestrator->describe(id).value().state;
  }
};

sb::ExecRequest session_exec(const std::string &command) {
  return sb::ExecRequest{.command = command, .mode = sb::ExecMode::Session, .timeout = {}};
}

} // namespace

void register_orchestrator_tests(std::vector<sos::tests::TestCase> &tests) {
  using sos::tests::require;
  using sos::common::ErrorCode;
  using S = sb::SandboxState;

  tests.push_back({"orchestrator_create_validates_spec", [] {
                     Harness h;
                     auto bad = h.orchestrator->create(
                         sb::SandboxSpec{.image = "two words", .setup_commands = {}});
                     require(bad.code() == ErrorCode::InvalidArgument, "whitespace in image");
                     auto flag = h.orchestrator->create(
                         sb::SandboxSpec{.image = "--privileged", .setup_commands = {}});
                     require(flag.code() == ErrorCode::InvalidArgument, "image cannot be a flag");

                     auto id = h.orchestrator->create(
                         sb::SandboxSpec{.image = "  ", .setup_commands = {"apt update", " "}});
                     require(id.ok(), id.error());
                     const auto summary = h.orchestrator->describe(id.value()).value();
                     require(summary.image == "alpine:3", "blank image uses the default");
                     require(summary.setup_commands == std::vector<std::string>({"apt update"}),
                             "blank setup commands dropped");
                     require(summary.state == S::Created, "created");
                     require(h.runtime->create_calls.load() == 0, "create does not touch runtime");
                   }});

  tests.push_back({"orchestrator_start_and_exec", [] {
                     sos::testing::ScopedRecordingObserver scoped;
                     Harness h;
                     h.runtime->set_standalone_handler([](const std::string &) {
                       return sos::common::Result<sb::CommandResult>::success(
                           sb::CommandResult{.stdout_text = "alone\n\n",
                                             .stderr_text = "warn\n",
                                             .exit_code = 5});
                     });
                     const auto id = h.running();
                     require(h.state(id) == S::Running, "running after start");
                     require(h.orchestrator->describe(id).value().started_at.has_value(),
                             "start time recorded");

                     auto session = h.orchestrator->exec(id, session_exec("ls -la"));
                     require(session.ok(), session.error());
                     require(session.value().stdout_text == "out:ls -la", "session output");

                     auto alone = h.orchestrator->exec(
                         id, sb::ExecRequest{.command = "make", .mode = sb::ExecMode::Standalone,
                                             .timeout = {}});
                     require(alone.ok(), alone.error());
                     require(alone.value().exit_code == 5, "non-zero exit is a result");
                     require(alone.value().stdout_text == "alone" &&
                                 alone.value().stderr_text == "warn",
                             "standalone output trimmed like session output");

                     const auto summary = h.orchestrator->describe(id).value();
                     require(summary.session_command_count == 1 &&
                                 summary.standalone_command_count == 1,
                             "per-mode counters");
                     require(summary.last_standalone_exit_code == std::optional<int>(5),
                             "last standalone exit code");

                     const auto trajectory = h.orchestrator->trajectory(id).value();
                     require(trajectory.records.size() == 2, "both commands recorded");
                     require(trajectory.records[0].mode == sb::ExecMode::Session &&
                                 trajectory.records[1].mode == sb::ExecMode::Standalone,
                             "modes recorded in order");
                     require(scoped.observer().transitions(id) ==
                                 std::vector<std::string>(
                                     {"new->created", "created->starting", "starting->running"}),
                             "lifecycle events");
                   }});

  tests.push_back({"orchestrator_exec_preconditions", [] {
                     Harness h;
                     auto missing = h.orchestrator->exec("nope", session_exec("ls"));
                     require(missing.code() == ErrorCode::NotFound, "unknown sandbox");

                     auto id = h.orchestrator->create(sb::SandboxSpec{});
                     auto early = h.orchestrator->exec(id.value(), session_exec("ls"));
                     require(early.code() == ErrorCode::InvalidTransition, "not running yet");

                     const auto running = h.running();
                     auto blank = h.orchestrator->exec(running, session_exec("  "));
                     require(blank.code() == ErrorCode::InvalidArgument, "blank command");
                     require(h.orchestrator->trajectory(running).value().records.empty(),
                             "rejected commands are not recorded");
                   }});

  tests.push_back({"orchestrator_admission_limit", [] {
                     Harness h(test_options(1));
                     const auto first = h.running();
                     auto second = h.orchestrator->create(sb::SandboxSpec{});
                     require(second.ok(), second.error());
                     auto refused = h.orchestrator->start(second.value());
                     require(refused.code() == ErrorCode::AdmissionExhausted, "capacity reached");
                     require(h.state(second.value()) == S::Created,
                             "refused sandbox stays created");
                     require(h.runtime->create_calls.load() == 1, "no container for refused");

                     auto stopped = h.orchestrator->stop(first);
                     require(stopped.ok(), stopped.error());
                     require(stopped.value().state == S::Stopped, "stop result is stopped");
                     auto retried = h.orchestrator->start(second.value());
                     require(retried.ok(), retried.error());
                     require(h.orchestrator->admission().in_use() == 1, "one slot in use");
                   }});

  tests.push_back({"orchestrator_admission_waits_for_capacity", [] {
                     auto options = test_options(1);
                     options.admission_wait = std::chrono::seconds(5);
                     Harness h(options);
                     const auto first = h.running();
                     auto second = h.orchestrator->create(sb::SandboxSpec{}).value();
                     sos::common::Status waited = sos::common::Status::success();
                     std::thread starter([&] { waited = h.orchestrator->start(second); });
                     require(sos::testing::eventually(
                                 [&] { return h.orchestrator->admission().waiting() == 1; }),
                             "start should queue for admission");
                     require(h.orchestrator->stop(first).ok(), "stop first");
                     starter.join();
                     require(waited.ok(), waited.error());
                     require(h.state(second) == S::Running, "waiter runs after release");
                   }});

  tests.push_back({"orchestrator_stop_rules", [] {
                     Harness h;
                     auto created = h.orchestrator->create(sb::SandboxSpec{}).value();
                     require(h.orchestrator->stop(created).code() == ErrorCode::InvalidTransition,
                             "created sandbox cannot be stopped");
                     const auto id = h.running();
                     require(h.orchestrator->stop(id).ok(), "first stop");
                     require(h.orchestrator->stop(id).code() == ErrorCode::InvalidTransition,
                             "second stop is a conflict");
                     require(h.runtime->stop_calls.load() == 1 && h.runtime->remove_calls.load() == 1,
                             "container cleaned up once");
                     require(h.orchestrator->admission().in_use() == 0, "capacity returned");
                     require(h.orchestrator->start(id).code() == ErrorCode::InvalidTransition,
                             "stopped sandbox cannot restart");
                   }});

  tests.push_back({"orchestrator_stop_with_remove", [] {
                     Harness h;
                     const auto id = h.running();
                     auto stopped = h.orchestrator->stop(id, true);
                     require(stopped.ok(), stopped.error());
                     require(stopped.value().state == S::Stopped, "summary taken before removal");
                     require(h.orchestrator->describe(id).code() == ErrorCode::NotFound,
                             "record removed");
                     require(h.orchestrator->trajectory(id).code() == ErrorCode::NotFound,
                             "trajectory removed");
                   }});

  tests.push_back({"orchestrator_stop_cleanup_failure", [] {
                     Harness h;
                     const auto id = h.running();
                     h.runtime->fail_remove = 1;
                     auto stopped = h.orchestrator->stop(id);
                     require(stopped.code() == ErrorCode::Runtime, "cleanup failure surfaces");
                     require(h.state(id) == S::Failed, "sandbox ends failed");
                     require(h.orchestrator->admission().in_use() == 0,
                             "capacity returned even on failure");
                   }});

  tests.push_back({"orchestrator_session_timeout_fails_sandbox", [] {
                     Harness h;
                     const auto id = h.running();
                     auto hung = h.orchestrator->exec(
                         id, sb::ExecRequest{.command = "sleep 100",
                                             .mode = sb::ExecMode::Session,
                                             .timeout = std::chrono::milliseconds(150)});
                     require(hung.code() == ErrorCode::SessionTimeout, "expected timeout");
                     const auto summary = h.orchestrator->describe(id).value();
                     require(summary.state == S::Failed, "timed out sandbox is failed");
                     require(summary.failure_reason.rfind("session_timeout", 0) == 0,
                             "reason names the timeout: " + summary.failure_reason);
                     require(h.orchestrator->admission().in_use() == 0, "capacity returned");
                     require(h.runtime->remove_calls.load() == 1, "container removed");

                     const auto records = h.orchestrator->trajectory(id).value().records;
                     require(records.size() == 1 && records[0].exit_code == -1 &&
                                 records[0].error.rfind("session_timeout", 0) == 0,
                             "failed command recorded with its error");
                     require(h.orchestrator->exec(id, session_exec("ls")).code() ==
                                 ErrorCode::InvalidTransition,
                             "failed sandbox refuses commands");
                   }});

  tests.push_back({"orchestrator_session_closed_fails_sandbox", [] {
                     Harness h;
                     const auto id = h.running();
                     h.runtime->shell_for(id)->close_remote();
                     auto closed = h.orchestrator->exec(id, session_exec("ls"));
                     require(closed.code() == ErrorCode::SessionClosed, "closed shell");
                     require(h.state(id) == S::Failed, "sandbox failed");
                   }});

  tests.push_back({"orchestrator_setup_failure", [] {
                     Harness h;
                     h.runtime->set_standalone_handler([](const std::string &) {
                       return sos::common::Result<sb::CommandResult>::success(sb::CommandResult{
                           .stdout_text = "", .stderr_text = "E: no such package\n",
                           .exit_code = 100});
                     });
                     auto id = h.orchestrator->create(sb::SandboxSpec{
                         .image = "debian", .setup_commands = {"apt update", "apt install x"}});
                     auto started = h.orchestrator->start(id.value());
                     require(started.code() == ErrorCode::SetupFailed, "setup failure");
                     require(started.error().find("no such package") != std::string::npos,
                             "setup stderr reported");
                     require(h.runtime->standalone_commands() ==
                                 std::vector<std::string>({"apt update && apt install x"}),
                             "setup commands chained");
                     require(h.state(id.value()) == S::Failed, "failed");
                     require(h.runtime->live_containers() == 0, "container removed");
                     require(h.orchestrator->admission().in_use() == 0, "capacity returned");
                     require(h.runtime->attach_calls.load() == 0, "no session attached");
                   }});

  tests.push_back({"orchestrator_runtime_failures_during_start", [] {
                     Harness h;
                     h.runtime->fail_create = 1;
                     auto a = h.orchestrator->create(sb::SandboxSpec{}).value();
                     require(h.orchestrator->start(a).code() == ErrorCode::Runtime,
                             "create failure");
                     require(h.state(a) == S::Failed, "failed after create error");

                     h.runtime->fail_start = 1;
                     auto b = h.orchestrator->create(sb::SandboxSpec{}).value();
                     require(h.orchestrator->start(b).code() == ErrorCode::Runtime,
                             "start failure");
                     require(h.state(b) == S::Failed, "failed after start error");
                     require(h.runtime->live_containers() == 0, "created container cleaned up");
                     require(h.orchestrator->admission().in_use() == 0, "no capacity leaked");
                   }});

  tests.push_back({"orchestrator_unresponsive_shell_fails_start", [] {
                     Harness h;
                     h.runtime->set_answer_init(false);
                     auto id = h.orchestrator->create(sb::SandboxSpec{}).value();
                     auto started = h.orchestrator->start(id);
                     require(started.code() == ErrorCode::SessionTimeout, "init timeout");
                     require(h.state(id) == S::Failed, "failed");
                     require(h.orchestrator->admission().in_use() == 0, "capacity returned");
                   }});

  tests.push_back({"orchestrator_stop_while_starting", [] {
                     Harness h;
                     h.runtime->set_start_delay(std::chrono::milliseconds(300));
                     auto id = h.orchestrator->create(sb::SandboxSpec{}).value();
                     sos::common::Status started = sos::common::Status::success();
                     std::thread starter([&] { started = h.orchestrator->start(id); });
                     require(sos::testing::eventually([&] { return h.state(id) == S::Starting; }),
                             "should be starting");
                     auto stopped = h.orchestrator->stop(id);
                     starter.join();
                     require(stopped.ok(), stopped.error());
                     require(stopped.value().state == S::Stopped, "stopped");
                     require(started.code() == ErrorCode::Cancelled, "start reports cancellation");
                     require(h.runtime->attach_calls.load() == 0, "no session after stop");
                     require(h.runtime->live_containers() == 0, "container cleaned up");
                     require(h.orchestrator->admission().in_use() == 0, "capacity returned");
                   }});

  tests.push_back({"orchestrator_second_start_rejected_while_first_waits", [] {
                     auto options = test_options(1);
                     options.admission_wait = std::chrono::seconds(5);
                     Harness h(options);
                     const auto holder = h.running();
                     auto id = h.orchestrator->create(sb::SandboxSpec{}).value();
                     h.runtime->set_start_delay(std::chrono::milliseconds(300));

                     sos::common::Status first = sos::common::Status::success();
                     std::thread starter([&] { first = h.orchestrator->start(id); });
                     require(sos::testing::eventually(
                                 [&] { return h.orchestrator->admission().waiting() == 1; }),
                             "first start should queue for admission");
                     auto second = h.orchestrator->start(id);
                     require(second.code() == ErrorCode::InvalidTransition,
                             "second start is a state conflict: " + second.error());
                     require(h.orchestrator->admission().waiting() == 1,
                             "second start never queued for capacity");
                     require(h.state(id) == S::Created, "waiting start keeps the sandbox created");

                     require(h.orchestrator->stop(holder).ok(), "free the slot");
                     require(sos::testing::eventually([&] { return h.state(id) == S::Starting; }),
                             "admitted start should provision");
                     auto stopped = h.orchestrator->stop(id);
                     starter.join();
                     require(stopped.ok(), stopped.error());
                     require(stopped.value().state == S::Stopped, "stopped");
                     require(first.code() == ErrorCode::Cancelled, "first start cancelled");
                     require(h.runtime->attach_calls.load() == 1,
                             "provisioning aborted before attach");
                     require(h.orchestrator->admission().in_use() == 0, "capacity returned");
                   }});

  tests.push_back({"orchestrator_concurrent_starts_take_one_slot", [] {
                     Harness h(test_options(2));
                     h.runtime->set_start_delay(std::chrono::milliseconds(100));
                     auto id = h.orchestrator->create(sb::SandboxSpec{}).value();
                     std::vector<sos::common::Status> outcomes(2, sos::common::Status::success());
                     std::vector<std::thread> starters;
                     for (std::size_t i = 0; i < outcomes.size(); ++i) {
                       starters.emplace_back([&, i] { outcomes[i] = h.orchestrator->start(id); });
                     }
                     for (auto &starter : starters) {
                       starter.join();
                     }
                     const bool first_won = outcomes[0].ok();
                     const auto &loser = first_won ? outcomes[1] : outcomes[0];
                     require(outcomes[0].ok() != outcomes[1].ok(), "exactly one start wins");
                     require(loser.code() == ErrorCode::InvalidTransition, loser.error());
                     require(h.state(id) == S::Running, "running");
                     require(h.orchestrator->admission().in_use() == 1, "one slot in use");
                     require(h.runtime->create_calls.load() == 1, "one container");
                   }});

  tests.push_back({"orchestrator_concurrent_execs_keep_trajectory_order", [] {
                     Harness h;
                     const auto id = h.running();
                     auto shell = h.runtime->shell_for(id);
                     require(shell != nullptr, "shell attached");

                     std::vector<std::thread> callers;
                     callers.emplace_back(
                         [&] { (void)h.orchestrator->exec(id, session_exec("sleep 1")); });
                     require(sos::testing::eventually([&] { return shell->commands().size() == 1; }),
                             "first command should be running");
                     constexpr std::size_t kCallers = 6;
                     for (std::size_t i = 0; i < kCallers; ++i) {
                       callers.emplace_back([&, i] {
                         (void)h.orchestrator->exec(id, session_exec("cmd" + std::to_string(i)));
                       });
                     }
                     std::this_thread::sleep_for(std::chrono::milliseconds(150));
                     shell->finish_hung();
                     for (auto &caller : callers) {
                       caller.join();
                     }

                     const auto served = shell->commands();
                     const auto records = h.orchestrator->trajectory(id).value().records;
                     require(served.size() == kCallers + 1, "every command reached the shell");
                     require(records.size() == served.size(), "every command recorded");
                     for (std::size_t i = 0; i < records.size(); ++i) {
                       require(records[i].command == served[i],
                               "record " + std::to_string(i) + " is " + records[i].command +
                                   ", shell ran " + served[i]);
                       require(records[i].stdout_text ==
                                   (i == 0 ? std::string() : "out:" + served[i]),
                               "output recorded with its command");
                       if (i > 0) {
                         require(records[i].index > records[i - 1].index,
                                 "indices strictly increase");
                       }
                     }
                   }});

  tests.push_back({"orchestrator_discard", [] {
                     Harness h;
                     auto created = h.orchestrator->create(sb::SandboxSpec{}).value();
                     require(h.orchestrator->discard(created).ok(), "discard created");
                     require(h.orchestrator->describe(created).code() == ErrorCode::NotFound,
                             "gone");

                     const auto running = h.running();
                     require(h.orchestrator->discard(running).ok(), "discard running");
                     require(h.orchestrator->list().empty(), "nothing left");
                     require(h.runtime->live_containers() == 0, "container removed");
                     require(h.orchestrator->discard("nope").code() == ErrorCode::NotFound,
                             "unknown id");
                   }});

  tests.push_back({"orchestrator_list_in_creation_order", [] {
                     Harness h;
                     const auto a = h.orchestrator->create(sb::SandboxSpec{}).value();
                     const auto b = h.running();
                     const auto listed = h.orchestrator->list();
                     require(listed.size() == 2 && listed[0].id == a && listed[1].id == b,
                             "creation order");
                     require(listed[0].state == S::Created && listed[1].state == S::Running,
                             "states");
                   }});

  tests.push_back({"orchestrator_reaps_expired_sandboxes", [] {
                     auto options = test_options();
                     options.max_lifetime = std::chrono::seconds(1);
                     Harness h(options);
                     const auto id = h.running();
                     require(h.orchestrator->reap_expired() == 0, "too young to reap");
                     std::this_thread::sleep_for(std::chrono::milliseconds(1'100));
                     require(h.orchestrator->reap_expired() == 1, "expired sandbox reaped");
                     require(h.orchestrator->describe(id).code() == ErrorCode::NotFound,
                             "reaped sandbox removed");
                     require(h.orchestrator->admission().in_use() == 0, "capacity returned");
                   }});

  tests.push_back({"orchestrator_bounded_trajectory", [] {
                     auto options = test_options();
                     options.trajectory_max_records = 2;
                     Harness h(options);
                     const auto id = h.running();
                     for (const auto *command : {"one", "two", "three"}) {
                       require(h.orchestrator->exec(id, session_exec(command)).ok(), command);
                     }
                     const auto snapshot = h.orchestrator->trajectory(id).value();
                     require(snapshot.records.size() == 2 && snapshot.dropped == 1,
                             "oldest record evicted");
                     require(snapshot.records[0].command == "two", "kept the newest");
                     const auto text = h.orchestrator->formatted_trajectory(id).value();
                     require(text.find("1 earlier command(s) truncated") != std::string::npos,
                             "truncation shown: " + text);
                     require(text.find("$ three\nout:three") != std::string::npos,
                             "command and output shown");
                   }});

  tests.push_back({"orchestrator_shutdown_sweeps", [] {
                     sos::testing::ScopedRecordingObserver scoped;
                     Harness h;
                     const auto a = h.running();
                     const auto b = h.running();
                     h.orchestrator->shutdown();
                     require(h.state(a) == S::Stopped && h.state(b) == S::Stopped,
                             "live sandboxes stopped");
                     require(h.runtime->live_containers() == 0, "containers removed");
                     require(h.orchestrator->create(sb::SandboxSpec{}).code() ==
                                 ErrorCode::Cancelled,
                             "no new sandboxes after shutdown");
                     require(scoped.observer().transitions(a).back() == "stopping->stopped",
                             "stop observed");
                   }});
}
