#include "test_framework.hpp"

#include "mnemobox/common/json_util.hpp"
#include "mnemobox/observability/factory.hpp"
#include "mnemobox/observability/global.hpp"
#include "mnemobox/observability/log_observer.hpp"
#include "mnemobox/observability/metrics_monitor.hpp"
#include "mnemobox/observability/multi_observer.hpp"
#include "mnemobox/observability/noop_observer.hpp"

#include <chrono>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

namespace {

struct CounterState {
  int events = 0;
  int metrics = 0;
};

class CountingObserver final : public mnemobox::observability::IObserver {
public:
  explicit CountingObserver(CounterState *state) : state_(state) {}

  void record_event(const mnemobox::observability::ObserverEvent &) override { ++state_->events; }
  void record_metric(const mnemobox::observability::ObserverMetric &) override {
    ++state_->metrics;
  }
  [[nodiscard]] std::string_view name() const override { return "counting"; }

private:
  CounterState *state_ = nullptr;
};

class FailingObserver final : public mnemobox::observability::IObserver {
public:
  void record_event(const mnemobox::observability::ObserverEvent &) override {
    throw std::runtime_error("sink closed");
  }
  void record_metric(const mnemobox::observability::ObserverMetric &) override {
    throw std::runtime_error("sink closed");
  }
  [[nodiscard]] std::string_view name() const override { return "failing"; }
};

/// Redirects std::cerr into a buffer for the guard's lifetime.
class StderrCapture {
public:
  StderrCapture() : previous_(std::cerr.rdbuf(buffer_.rdbuf())) {}
  ~StderrCapture() { std::cerr.rdbuf(previous_); }

  StderrCapture(const StderrCapture &) = delete;
  StderrCapture &operator=(const StderrCapture &) = delete;

  [[nodiscard]] std::string text() const { return buffer_.str(); }

private:
  std::ostringstream buffer_;
  std::streambuf *previous_;
};

} // namespace

void register_observability_tests(std::vector<mnemobox::tests::TestCase> &tests) {
  using mnemobox::tests::require;
  namespace ob = mnemobox::observability;
  namespace sb = mnemobox::sandbox;

  tests.push_back({"observability_global_noop", [] {
                     ob::set_global_observer(std::make_shared<ob::NoopObserver>());
                     require(ob::get_global_observer() != nullptr, "observer should be set");
                     require(ob::get_global_observer()->name() == "noop", "expected noop observer");

                     ob::record_event(ob::SlotRequestedEvent{.execution_id = "abc"});
                     ob::record_metric(ob::ExecutionLatencyMetric{.latency = std::chrono::milliseconds(5)});

                     ob::set_global_observer(nullptr);
                     ob::record_error("unit", "dropped without an observer");
                   }});

  tests.push_back({"observability_multi_forwards_to_children", [] {
                     CounterState one;
                     CounterState two;
                     auto multi = std::make_shared<ob::MultiObserver>();
                     multi->add(std::make_shared<CountingObserver>(&one));
                     multi->add(std::make_shared<CountingObserver>(&two));
                     require(multi->size() == 2, "children not added");

                     ob::set_global_observer(multi);
                     ob::record_error("unit", "boom");
                     ob::record_metric(ob::ConcurrencyMetric{.active = 3, .awaiting = 1});

                     require(one.events == 1 && two.events == 1, "event should be forwarded");
                     require(one.metrics == 1 && two.metrics == 1, "metric should be forwarded");

                     // Reset before local CounterState variables go out of scope
                     ob::set_global_observer(nullptr);
                   }});

  tests.push_back({"observability_factory_selects_backend", [] {
                     auto none = ob::create_observer("none");
                     require(none.ok() && none.value()->name() == "noop",
                             "none backend should map to noop");
                     auto empty = ob::create_observer("");
                     require(empty.ok() && empty.value()->name() == "noop",
                             "empty backend should map to noop");
                     auto log = ob::create_observer(" LOG ");
                     require(log.ok() && log.value()->name() == "log",
                             "log backend should map to log observer");
                     auto multi = ob::create_observer("log,noop");
                     require(multi.ok() && multi.value()->name() == "multi",
                             "comma backend should map to multi observer");

                     require(!ob::create_observer("prometheus").ok(), "unknown backend accepted");
                     require(!ob::create_observer("log,statsd").ok(), "unknown list part accepted");
                     require(ob::is_known_backend("log, none"), "known list rejected");
                     require(!ob::is_known_backend("otel"), "unknown backend reported known");
                   }});

  tests.push_back({"observability_multi_contains_failing_member", [] {
                     CounterState after;
                     auto multi = std::make_shared<ob::MultiObserver>();
                     multi->add(std::make_shared<FailingObserver>());
                     multi->add(std::make_shared<CountingObserver>(&after));
                     std::string text;
                     {
                       StderrCapture capture;
                       multi->record_event(ob::SlotRequestedEvent{.execution_id = "x"});
                       multi->record_metric(ob::ConcurrencyMetric{.active = 1, .awaiting = 0});
                       text = capture.text();
                     }
                     require(after.events == 1 && after.metrics == 1,
                             "member after a failing one was skipped");
                     require(text.find("observer failing failed to record event: sink closed") !=
                                 std::string::npos,
                             "failure not reported: " + text);
                   }});

  tests.push_back({"log_observer_honours_level_and_stream", [] {
                     std::ostringstream out;
                     ob::LogObserver observer(ob::LogLevel::Info, &out);
                     observer.record_event(ob::SlotRequestedEvent{.execution_id = "id2"});
                     observer.record_metric(ob::ConcurrencyMetric{.active = 2, .awaiting = 0});
                     observer.record_event(ob::SlotAcquiredEvent{
                         .execution_id = "id2", .wait = std::chrono::milliseconds(50), .acquired = false});
                     const auto text = out.str();
                     require(text.find("[DEBUG]") == std::string::npos, "debug lines not filtered: " + text);
                     require(text == "[WARN] slot.timeout id=id2 wait_ms=50\n", "unexpected log: " + text);
                   }});

  tests.push_back({"log_observer_writes_tagged_lines", [] {
                     ob::LogObserver observer;
                     std::string text;
                     {
                       StderrCapture capture;
                       observer.record_event(ob::ExecutionStartedEvent{
                           .execution_id = "id1", .task = "demo", .code_sha256 = "feed"});
                       observer.record_event(ob::ExecutionFinishedEvent{
                           .execution_id = "id1",
                           .kind = sb::OutcomeKind::SecurityViolation,
                           .violation = sb::ViolationType::NetworkAccess,
                           .duration = std::chrono::milliseconds(12)});
                       observer.record_event(ob::ErrorEvent{.component = "sandbox", .message = "boom"});
                       text = capture.text();
                     }
                     require(text.find("[INFO] execution.start id=id1 task=demo") != std::string::npos,
                             "start line missing: " + text);
                     require(text.find("[WARN] execution.end id=id1 outcome=security_violation") !=
                                 std::string::npos,
                             "violation line missing: " + text);
                     require(text.find("violation=network_access") != std::string::npos,
                             "violation type missing: " + text);
                     require(text.find("[ERROR] sandbox: boom") != std::string::npos,
                             "error line missing: " + text);
                   }});

  tests.push_back({"metrics_monitor_counts_results", [] {
                     ob::MetricsMonitor monitor;
                     monitor.record(sb::Success{.output = "1",
                                                .execution_time = std::chrono::milliseconds(30)});
                     monitor.record(sb::Success{.output = "2",
                                                .execution_time = std::chrono::milliseconds(10)});
                     monitor.record(sb::Error{.message = "TypeError: x"});
                     monitor.record(sb::SecurityViolation{
                         .reason = "denied", .violation_type = sb::ViolationType::FilesystemAccess});

                     const auto snapshot = monitor.snapshot();
                     require(snapshot.total == 4, "total mismatch");
                     require(snapshot.by_outcome_kind.at(sb::OutcomeKind::Success) == 2,
                             "success count");
                     require(snapshot.by_outcome_kind.at(sb::OutcomeKind::Timeout) == 0,
                             "timeout count");
                     require(snapshot.success_rate == 0.5, "success rate");
                     require(snapshot.average_execution_time == std::chrono::milliseconds(10),
                             "average time");

                     const auto json = mnemobox::common::json_parse_flat(snapshot.to_json());
                     require(json.at("total") == "4", "json total");
                     require(json.at("success_rate") == "0.5000", "json success rate");
                     require(json.at("by_outcome_kind").find("\"security_violation\":1") !=
                                 std::string::npos,
                             "json breakdown: " + json.at("by_outcome_kind"));
                   }});

  tests.push_back({"metrics_monitor_tracks_concurrency_events", [] {
                     ob::MetricsMonitor monitor;
                     for (const char *id : {"a", "b", "c"}) {
                       monitor.record_event(ob::SlotRequestedEvent{.execution_id = id});
                     }
                     monitor.record_event(ob::SlotAcquiredEvent{.execution_id = "a"});
                     monitor.record_event(ob::SlotAcquiredEvent{.execution_id = "b"});
                     auto snapshot = monitor.snapshot();
                     require(snapshot.current_concurrency == 2, "active gauge");
                     require(snapshot.awaiting_slot == 1, "awaiting gauge");

                     monitor.record_event(ob::SlotAcquiredEvent{.execution_id = "c", .acquired = false});
                     monitor.record_event(ob::ExecutionFinishedEvent{
                         .execution_id = "c", .kind = sb::OutcomeKind::Timeout, .held_slot = false});
                     monitor.record_event(ob::ExecutionFinishedEvent{
                         .execution_id = "a", .kind = sb::OutcomeKind::Success, .held_slot = true});
                     monitor.record_event(ob::ExecutionFinishedEvent{.execution_id = "b",
                                                                     .kind = sb::OutcomeKind::Error,
                                                                     .held_slot = true,
                                                                     .host_failure = true});
                     snapshot = monitor.snapshot();
                     require(snapshot.current_concurrency == 0 && snapshot.awaiting_slot == 0,
                             "gauges not drained");
                     require(snapshot.peak_concurrency == 2, "peak");
                     require(snapshot.total == 3, "finished events not counted");
                     require(snapshot.host_failures == 1, "host failures");
                   }});
}
