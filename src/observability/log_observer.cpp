#include "engram/observability/log_observer.hpp"

#include <cstdlib>
#include <iostream>
#include <type_traits>

namespace engram::observability {

namespace {

bool verbose_from_env() {
  const char *value = std::getenv("ENGRAM_LOG_VERBOSE");
  return value != nullptr && *value != '\0' && std::string(value) != "0";
}

std::string bool_text(const bool value) { return value ? "true" : "false"; }

} // namespace

LogObserver::LogObserver() : LogObserver(std::cerr, verbose_from_env()) {}

LogObserver::LogObserver(std::ostream &out, const bool verbose) : out_(out), verbose_(verbose) {}

void LogObserver::log_line(const std::string_view level, const std::string &message) {
  if (level == "DEBUG" && !verbose_) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  out_ << "[" << level << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, MemoryStoredEvent>) {
          log_line("INFO", "memory.stored owner=" + evt.owner_id +
                               " id=" + std::to_string(evt.memory_id) +
                               " category=" + evt.category + " indexed=" + bool_text(evt.indexed));
        } else if constexpr (std::is_same_v<T, MemoriesRecalledEvent>) {
          log_line("DEBUG", "memory.recalled owner=" + evt.owner_id +
                                " count=" + std::to_string(evt.count) +
                                " strategy=" + evt.strategy);
        } else if constexpr (std::is_same_v<T, FallbackEvent>) {
          log_line("WARN", "fallback " + evt.component + ": " + evt.reason);
        } else if constexpr (std::is_same_v<T, LearnEvent>) {
          log_line("INFO", "learner.pass owner=" + evt.owner_id +
                               " scanned=" + std::to_string(evt.scanned) +
                               " learned=" + std::to_string(evt.learned));
        } else if constexpr (std::is_same_v<T, SweepEvent>) {
          log_line("INFO", "sweeper.run purged=" + std::to_string(evt.purged) +
                               " index_failures=" + std::to_string(evt.index_failures));
        } else if constexpr (std::is_same_v<T, IndexRebuiltEvent>) {
          log_line("INFO", "index.rebuilt owners=" + std::to_string(evt.owners) +
                               " entries=" + std::to_string(evt.entries) +
                               " failures=" + std::to_string(evt.failures));
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, RecallLatencyMetric>) {
          log_line("DEBUG", "metric.recall_latency_ms=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, EmbeddingLatencyMetric>) {
          log_line("DEBUG", "metric.embedding_latency_ms=" + std::to_string(m.latency.count()) +
                                " provider=" + m.provider);
        } else if constexpr (std::is_same_v<T, IndexSizeMetric>) {
          log_line("DEBUG", "metric.index_entries=" + std::to_string(m.entries));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_.flush();
}

} // namespace engram::observability
