#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace engram::observability {

struct MemoryStoredEvent {
  std::string owner_id;
  std::int64_t memory_id = 0;
  std::string category;
  bool indexed = false;
};

struct MemoriesRecalledEvent {
  std::string owner_id;
  std::size_t count = 0;
  std::string strategy;
};

struct FallbackEvent {
  std::string component;
  std::string reason;
};

struct LearnEvent {
  std::string owner_id;
  std::size_t scanned = 0;
  std::size_t learned = 0;
};

struct SweepEvent {
  std::size_t purged = 0;
  std::size_t index_failures = 0;
};

struct IndexRebuiltEvent {
  std::size_t owners = 0;
  std::size_t entries = 0;
  std::size_t failures = 0;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<MemoryStoredEvent, MemoriesRecalledEvent, FallbackEvent,
                                   LearnEvent, SweepEvent, IndexRebuiltEvent, ErrorEvent>;

struct RecallLatencyMetric {
  std::chrono::milliseconds latency{0};
};

struct EmbeddingLatencyMetric {
  std::string provider;
  std::chrono::milliseconds latency{0};
};

struct IndexSizeMetric {
  std::uint64_t entries = 0;
};

using ObserverMetric = std::variant<RecallLatencyMetric, EmbeddingLatencyMetric, IndexSizeMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace engram::observability
