#include "engram/observability/global.hpp"

#include <mutex>

namespace engram::observability {

namespace {

std::mutex g_observer_mutex;
std::shared_ptr<IObserver> g_observer;

std::shared_ptr<IObserver> current_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer;
}

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::shared_ptr<IObserver> previous;
  {
    std::lock_guard<std::mutex> lock(g_observer_mutex);
    previous = std::move(g_observer);
    g_observer = std::move(observer);
  }
  if (previous != nullptr) {
    previous->flush();
  }
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto observer = current_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto observer = current_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_memory_stored(const std::string &owner_id, const std::int64_t memory_id,
                          const std::string &category, const bool indexed) {
  record_event(MemoryStoredEvent{
      .owner_id = owner_id, .memory_id = memory_id, .category = category, .indexed = indexed});
}

void record_memories_recalled(const std::string &owner_id, const std::size_t count,
                              const std::string &strategy) {
  record_event(MemoriesRecalledEvent{.owner_id = owner_id, .count = count, .strategy = strategy});
}

void record_fallback(const std::string &component, const std::string &reason) {
  record_event(FallbackEvent{.component = component, .reason = reason});
}

void record_learn(const std::string &owner_id, const std::size_t scanned,
                  const std::size_t learned) {
  record_event(LearnEvent{.owner_id = owner_id, .scanned = scanned, .learned = learned});
}

void record_sweep(const std::size_t purged, const std::size_t index_failures) {
  record_event(SweepEvent{.purged = purged, .index_failures = index_failures});
}

void record_index_rebuilt(const std::size_t owners, const std::size_t entries,
                          const std::size_t failures) {
  record_event(IndexRebuiltEvent{.owners = owners, .entries = entries, .failures = failures});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

void record_recall_latency(const std::chrono::milliseconds latency) {
  record_metric(RecallLatencyMetric{.latency = latency});
}

void record_embedding_latency(const std::string &provider,
                              const std::chrono::milliseconds latency) {
  record_metric(EmbeddingLatencyMetric{.provider = provider, .latency = latency});
}

} // namespace engram::observability
