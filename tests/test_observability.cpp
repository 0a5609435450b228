#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "sos/observability/factory.hpp"
#include "sos/observability/global.hpp"
#include "sos/observability/observers.hpp"

#include <variant>

void register_observability_tests(std::vector<sos::tests::TestCase> &tests) {
  using sos::tests::require;
  namespace obs = sos::observability;

  tests.push_back({"observability_factory_backends", [] {
                     sos::config::Config config;
                     config.observability.backend = "none";
                     require(obs::create_observer(config)->name() == "noop", "none -> noop");
                     config.observability.backend = "LOG";
                     require(obs::create_observer(config)->name() == "log", "log backend");
                     config.observability.backend = "log, none";
                     auto multi = obs::create_observer(config);
                     require(multi->name() == "multi", "comma list -> multi");
                     require(dynamic_cast<obs::MultiObserver *>(multi.get())->size() == 2,
                             "multi should hold both backends");
                   }});

  tests.push_back({"observability_multi_fans_out", [] {
                     auto first = std::make_unique<sos::testing::RecordingObserver>();
                     auto second = std::make_unique<sos::testing::RecordingObserver>();
                     auto *first_raw = first.get();
                     auto *second_raw = second.get();
                     obs::MultiObserver multi;
                     multi.add(std::move(first));
                     multi.add(nullptr);
                     multi.add(std::move(second));
                     require(multi.size() == 2, "null observers are skipped");

                     multi.record_event(obs::ServerEvent{.action = "listening", .detail = ""});
                     multi.record_metric(obs::AdmissionWaitersMetric{.depth = 3});
                     require(first_raw->events().size() == 1 && second_raw->events().size() == 1,
                             "events reach every observer");
                     require(first_raw->metrics().size() == 1 && second_raw->metrics().size() == 1,
                             "metrics reach every observer");
                   }});

  tests.push_back({"observability_global_helpers", [] {
                     sos::testing::ScopedRecordingObserver scoped;
                     obs::record_server("listening", "127.0.0.1:3000");
                     obs::record_state_change("abc", "created", "starting");
                     require(scoped.observer().events().size() == 2, "two events recorded");
                     require(scoped.observer().transitions("abc") ==
                                 std::vector<std::string>({"created->starting"}),
                             "state transition recorded");
                   }});

  tests.push_back({"observability_command_records_latency_metric", [] {
                     sos::testing::ScopedRecordingObserver scoped;
                     obs::record_command("abc", "session", 2, std::chrono::milliseconds(15));
                     const auto events = scoped.observer().events();
                     require(events.size() == 1, "one command event");
                     const auto *command = std::get_if<obs::CommandEvent>(&events[0]);
                     require(command != nullptr && command->exit_code == 2, "command event");
                     const auto metrics = scoped.observer().metrics();
                     require(metrics.size() == 1 &&
                                 std::holds_alternative<obs::ExecLatencyMetric>(metrics[0]),
                             "exec latency metric");
                   }});

  tests.push_back({"observability_no_observer_is_safe", [] {
                     obs::set_global_observer(nullptr);
                     obs::record_error("test", "nobody listens");
                     obs::record_metric(obs::ActiveSandboxesMetric{.count = 1});
                     require(obs::get_global_observer() == nullptr, "observer stays unset");
                   }});
}
