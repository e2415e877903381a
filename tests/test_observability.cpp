#include "test_framework.hpp"

#include "memoryos/config/schema.hpp"
#include "memoryos/observability/factory.hpp"
#include "memoryos/observability/global.hpp"
#include "memoryos/observability/log_observer.hpp"
#include "memoryos/observability/multi_observer.hpp"
#include "memoryos/observability/noop_observer.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace {

struct CounterState {
  int events = 0;
  int metrics = 0;
  int flushes = 0;
};

class CountingObserver final : public memoryos::observability::IObserver {
public:
  explicit CountingObserver(CounterState *state) : state_(state) {}

  void record_event(const memoryos::observability::ObserverEvent &) override { ++state_->events; }
  void record_metric(const memoryos::observability::ObserverMetric &) override {
    ++state_->metrics;
  }
  void flush() override { ++state_->flushes; }
  [[nodiscard]] std::string_view name() const override { return "counting"; }

private:
  CounterState *state_ = nullptr;
};

void restore_noop() {
  memoryos::observability::set_global_observer(
      std::make_unique<memoryos::observability::NoopObserver>());
}

} // namespace

void register_observability_tests(std::vector<memoryos::tests::TestCase> &tests) {
  using memoryos::tests::require;
  namespace ob = memoryos::observability;

  tests.push_back({"observability_global_noop", [] {
                     ob::set_global_observer(std::make_unique<ob::NoopObserver>());
                     require(ob::get_global_observer() != nullptr, "observer should be set");
                     require(ob::get_global_observer()->name() == "noop", "expected noop observer");

                     ob::record_event(ob::DuplicateSkippedEvent{.item_id = "abc"});
                     ob::record_metric(ob::IndexSizeMetric{.modality = "text", .size = 3});
                     ob::record_error("unit", "ignored");
                   }});

  tests.push_back({"observability_record_without_observer", [] {
                     ob::set_global_observer(nullptr);
                     ob::record_event(ob::SearchEvent{.modality = "text", .results = 1});
                     ob::record_error("unit", "no observer installed");
                     restore_noop();
                   }});

  tests.push_back({"observability_multi_forwards_to_children", [] {
                     CounterState one;
                     CounterState two;
                     auto multi = std::make_unique<ob::MultiObserver>();
                     multi->add(std::make_unique<CountingObserver>(&one));
                     multi->add(std::make_unique<CountingObserver>(&two));

                     ob::set_global_observer(std::move(multi));
                     ob::record_event(ob::ErrorEvent{.component = "unit", .message = "boom"});
                     ob::record_metric(
                         ob::SearchLatencyMetric{.latency = std::chrono::milliseconds(4)});

                     require(one.events == 1 && two.events == 1, "event should be forwarded");
                     require(one.metrics == 1 && two.metrics == 1, "metric should be forwarded");

                     // Replacing the observer flushes the old one before local state goes away
                     restore_noop();
                     require(one.flushes == 1 && two.flushes == 1, "replaced observer should flush");
                   }});

  tests.push_back({"observability_factory_selects_backend", [] {
                     memoryos::config::Config config;
                     config.observability.backend = "none";
                     auto none = ob::create_observer(config);
                     require(none->name() == "noop", "none backend should map to noop");

                     config.observability.backend = " LOG ";
                     auto log = ob::create_observer(config);
                     require(log->name() == "log", "log backend should be case-insensitive");

                     config.observability.backend = "log,none";
                     auto multi = ob::create_observer(config);
                     require(multi->name() == "multi", "comma list should build a multi observer");
                     auto *as_multi = dynamic_cast<ob::MultiObserver *>(multi.get());
                     require(as_multi != nullptr && as_multi->size() == 2, "multi should hold two sinks");

                     config.observability.backend = "prometheus";
                     auto fallback = ob::create_observer(config);
                     require(fallback->name() == "log", "unknown backend should fall back to log");
                   }});

  tests.push_back({"observability_log_observer_handles_every_event", [] {
                     ob::LogObserver observer(false);
                     observer.record_event(ob::ItemIngestedEvent{.item_id = "a", .content_type = "text"});
                     observer.record_event(ob::EncodingSkippedEvent{.item_id = "a", .unit = "ocr", .reason = "blank"});
                     observer.record_event(ob::IndexCorruptEvent{.modality = "visual", .reason = "stale map"});
                     observer.record_metric(ob::IngestLatencyMetric{.latency = std::chrono::milliseconds(2)});
                     observer.flush();
                   }});

  tests.push_back({"observability_capture_collects_events", [] {
                     memoryos::testing::ScopedCapture capture;
                     ob::record_event(ob::IndexFlushedEvent{.modality = "text", .entries = 2});
                     ob::record_error("unit", "boom");
                     require(capture.telemetry().count<ob::IndexFlushedEvent>() == 1,
                             "flush event should be captured");
                     require(capture.telemetry().count<ob::ErrorEvent>() == 1,
                             "error event should be captured");
                   }});
}
