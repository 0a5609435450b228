#include "test_framework.hpp"

#include "sos/sandbox/trajectory.hpp"

#include <thread>
#include <vector>

namespace {

sos::sandbox::CommandRecord make_record(const std::string &command, const int exit_code = 0,
                                        const std::string &stdout_text = "") {
  sos::sandbox::CommandRecord record;
  record.command = command;
  record.exit_code = exit_code;
  record.stdout_text = stdout_text;
  record.started_at = std::chrono::system_clock::now();
  record.finished_at = record.started_at;
  return record;
}

} // namespace

void register_trajectory_tests(std::vector<sos::tests::TestCase> &tests) {
  using sos::tests::require;
  namespace sb = sos::sandbox;

  tests.push_back({"trajectory_append_assigns_indices", [] {
                     sb::TrajectoryRecorder recorder;
                     recorder.open("a");
                     auto first = recorder.append("a", make_record("ls"));
                     auto second = recorder.append("a", make_record("pwd"));
                     require(first.ok() && second.ok(), "appends should succeed");
                     require(first.value() == 0 && second.value() == 1, "indices count up");

                     auto snapshot = recorder.get("a");
                     require(snapshot.ok(), snapshot.error());
                     require(snapshot.value().records.size() == 2, "two records");
                     require(snapshot.value().records[1].command == "pwd", "order preserved");
                     require(!snapshot.value().truncated, "not truncated");
                   }});

  tests.push_back({"trajectory_unknown_sandbox", [] {
                     sb::TrajectoryRecorder recorder;
                     require(recorder.append("ghost", make_record("ls")).code() ==
                                 sos::common::ErrorCode::NotFound,
                             "append without open fails");
                     require(recorder.get("ghost").code() == sos::common::ErrorCode::NotFound,
                             "get without open fails");
                   }});

  tests.push_back({"trajectory_bounded_evicts_oldest", [] {
                     sb::TrajectoryRecorder recorder(3);
                     require(recorder.max_records() == 3, "bound reported");
                     recorder.open("a");
                     for (int i = 0; i < 5; ++i) {
                       (void)recorder.append("a", make_record("cmd" + std::to_string(i)));
                     }
                     auto snapshot = recorder.get("a").value();
                     require(snapshot.records.size() == 3, "bound respected");
                     require(snapshot.records.front().command == "cmd2", "oldest evicted first");
                     require(snapshot.records.front().index == 2, "indices survive eviction");
                     require(snapshot.truncated && snapshot.dropped == 2, "truncation marked");
                   }});

  tests.push_back({"trajectory_snapshot_is_a_copy", [] {
                     sb::TrajectoryRecorder recorder;
                     recorder.open("a");
                     (void)recorder.append("a", make_record("one"));
                     auto snapshot = recorder.get("a").value();
                     (void)recorder.append("a", make_record("two"));
                     require(snapshot.records.size() == 1, "snapshot must not change");
                   }});

  tests.push_back({"trajectory_erase_and_isolation", [] {
                     sb::TrajectoryRecorder recorder;
                     recorder.open("a");
                     recorder.open("b");
                     (void)recorder.append("a", make_record("only-a"));
                     require(recorder.get("b").value().records.empty(), "logs are per sandbox");
                     recorder.erase("a");
                     require(!recorder.get("a").ok(), "erased log is gone");
                   }});

  tests.push_back({"trajectory_concurrent_appends_keep_every_record", [] {
                     sb::TrajectoryRecorder recorder;
                     recorder.open("a");
                     std::vector<std::thread> writers;
                     for (int t = 0; t < 4; ++t) {
                       writers.emplace_back([&recorder] {
                         for (int i = 0; i < 50; ++i) {
                           (void)recorder.append("a", make_record("x"));
                         }
                       });
                     }
                     for (auto &writer : writers) {
                       writer.join();
                     }
                     const auto snapshot = recorder.get("a").value();
                     require(snapshot.records.size() == 200, "no record lost");
                     for (std::size_t i = 0; i < snapshot.records.size(); ++i) {
                       require(snapshot.records[i].index == i, "indices are dense and ordered");
                     }
                   }});

  tests.push_back({"trajectory_format_text", [] {
                     sb::TrajectorySnapshot snapshot;
                     snapshot.truncated = true;
                     snapshot.dropped = 4;
                     snapshot.records.push_back(make_record("echo hi", 0, "hi"));
                     auto failing = make_record("false", 1);
                     failing.mode = sb::ExecMode::Standalone;
                     snapshot.records.push_back(failing);
                     auto broken = make_record("sleep 100", -1);
                     broken.error = "session_timeout: no completion sentinel";
                     snapshot.records.push_back(broken);

                     const auto text = sb::format_trajectory(snapshot);
                     require(text == "... 4 earlier command(s) truncated ...\n"
                                     "$ echo hi\n"
                                     "hi\n"
                                     "$ false  [standalone]\n"
                                     "[exit 1]\n"
                                     "$ sleep 100\n"
                                     "[error] session_timeout: no completion sentinel\n",
                             "unexpected text:\n" + text);
                   }});
}
