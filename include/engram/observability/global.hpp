#pragma once

#include "engram/observability/observer.hpp"

#include <memory>

namespace engram::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_memory_stored(const std::string &owner_id, std::int64_t memory_id,
                          const std::string &category, bool indexed);
void record_memories_recalled(const std::string &owner_id, std::size_t count,
                              const std::string &strategy);
void record_fallback(const std::string &component, const std::string &reason);
void record_learn(const std::string &owner_id, std::size_t scanned, std::size_t learned);
void record_sweep(std::size_t purged, std::size_t index_failures);
void record_index_rebuilt(std::size_t owners, std::size_t entries, std::size_t failures);
void record_error(const std::string &component, const std::string &message);

void record_recall_latency(std::chrono::milliseconds latency);
void record_embedding_latency(const std::string &provider, std::chrono::milliseconds latency);

} // namespace engram::observability
