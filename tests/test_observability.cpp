#include "test_framework.hpp"

#include "engram/config/schema.hpp"
#include "engram/observability/factory.hpp"
#include "engram/observability/global.hpp"
#include "engram/observability/log_observer.hpp"
#include "engram/observability/multi_observer.hpp"
#include "engram/observability/noop_observer.hpp"

#include <sstream>

namespace {

class CountingObserver final : public engram::observability::IObserver {
public:
  void record_event(const engram::observability::ObserverEvent &event) override {
    ++events;
    if (std::holds_alternative<engram::observability::FallbackEvent>(event)) {
      ++fallbacks;
    }
  }
  void record_metric(const engram::observability::ObserverMetric &) override { ++metrics; }
  void flush() override { ++flushes; }
  [[nodiscard]] std::string_view name() const override { return "counting"; }

  int events = 0;
  int fallbacks = 0;
  int metrics = 0;
  int flushes = 0;
};

} // namespace

void register_observability_tests(std::vector<engram::tests::TestCase> &tests) {
  using engram::tests::require;
  namespace obs = engram::observability;

  tests.push_back({"log_observer_writes_levels", [] {
                     std::ostringstream out;
                     obs::LogObserver observer(out, false);
                     observer.record_event(obs::MemoryStoredEvent{
                         .owner_id = "alice", .memory_id = 7, .category = "fact", .indexed = true});
                     observer.record_event(
                         obs::FallbackEvent{.component = "ranker", .reason = "index offline"});
                     observer.record_event(
                         obs::ErrorEvent{.component = "sweeper", .message = "boom"});
                     const std::string text = out.str();
                     require(text.find("[INFO] memory.stored owner=alice id=7") !=
                                 std::string::npos,
                             "stored event missing: " + text);
                     require(text.find("[WARN] fallback ranker: index offline") !=
                                 std::string::npos,
                             "fallback should be a warning");
                     require(text.find("[ERROR] sweeper: boom") != std::string::npos,
                             "error line missing");
                   }});

  tests.push_back({"log_observer_hides_debug_unless_verbose", [] {
                     std::ostringstream quiet_out;
                     obs::LogObserver quiet(quiet_out, false);
                     quiet.record_metric(obs::RecallLatencyMetric{std::chrono::milliseconds(12)});
                     quiet.record_event(obs::MemoriesRecalledEvent{
                         .owner_id = "alice", .count = 2, .strategy = "vector"});
                     require(quiet_out.str().empty(), "debug lines should be hidden");

                     std::ostringstream verbose_out;
                     obs::LogObserver verbose(verbose_out, true);
                     verbose.record_metric(
                         obs::RecallLatencyMetric{std::chrono::milliseconds(12)});
                     require(verbose_out.str().find("metric.recall_latency_ms=12") !=
                                 std::string::npos,
                             "verbose should show metrics");
                   }});

  tests.push_back({"multi_observer_fans_out", [] {
                     obs::MultiObserver multi;
                     auto first = std::make_unique<CountingObserver>();
                     auto second = std::make_unique<CountingObserver>();
                     auto *first_ptr = first.get();
                     auto *second_ptr = second.get();
                     multi.add(std::move(first));
                     multi.add(std::move(second));
                     multi.add(nullptr);
                     require(multi.size() == 2, "null observers are ignored");

                     multi.record_event(obs::SweepEvent{.purged = 1, .index_failures = 0});
                     multi.record_metric(obs::IndexSizeMetric{.entries = 3});
                     multi.flush();
                     require(first_ptr->events == 1 && second_ptr->events == 1,
                             "every observer sees events");
                     require(first_ptr->metrics == 1 && second_ptr->flushes == 1,
                             "metrics and flush fan out");
                   }});

  tests.push_back({"factory_selects_backend", [] {
                     engram::config::Config config;
                     config.observability.backend = "none";
                     require(obs::create_observer(config)->name() == "noop", "none is noop");
                     config.observability.backend = "log";
                     require(obs::create_observer(config)->name() == "log", "log backend");
                     config.observability.backend = "log,none";
                     require(obs::create_observer(config)->name() == "multi",
                             "comma list builds a multi observer");
                     config.observability.backend = "prometheus";
                     require(obs::create_observer(config)->name() == "log",
                             "unknown backend falls back to log");
                   }});

  tests.push_back({"global_observer_receives_records", [] {
                     auto counting = std::make_unique<CountingObserver>();
                     auto *counting_ptr = counting.get();
                     obs::set_global_observer(std::move(counting));
                     obs::record_fallback("embedder", "no key");
                     obs::record_learn("alice", 3, 1);
                     obs::record_recall_latency(std::chrono::milliseconds(4));
                     require(counting_ptr->events == 2, "two events expected");
                     require(counting_ptr->fallbacks == 1, "one fallback expected");
                     require(counting_ptr->metrics == 1, "one metric expected");
                     obs::set_global_observer(std::make_unique<obs::NoopObserver>());
                   }});
}
