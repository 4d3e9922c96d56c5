#include "engram/memory/engine.hpp"

#include "engram/common/fs.hpp"
#include "engram/config/config.hpp"
#include "engram/memory/sqlite_ledger.hpp"
#include "engram/observability/global.hpp"

#include <algorithm>
#include <chrono>
#include <sstream>

namespace engram::memory {

namespace {

ContextMap index_metadata(const Memory &memory) {
  std::ostringstream importance;
  importance << memory.importance;
  return {{"category", category_to_string(memory.category)},
          {"importance", importance.str()}};
}

std::string join_window(const std::vector<ChatTurn> &history, const std::size_t window) {
  const std::size_t start = history.size() > window ? history.size() - window : 0;
  std::string joined;
  for (std::size_t i = start; i < history.size(); ++i) {
    const std::string content = common::trim(history[i].content);
    if (content.empty()) {
      continue;
    }
    if (!joined.empty()) {
      joined += ' ';
    }
    joined += content;
  }
  return joined;
}

} // namespace

EngineOptions EngineOptions::from_config(const config::Config &config) {
  return EngineOptions{
      .retrieval = config.retrieval, .context = config.context, .learner = config.learner};
}

MemoryEngine::MemoryEngine(std::unique_ptr<ILedger> ledger, std::unique_ptr<IEmbedder> embedder,
                           std::unique_ptr<IVectorIndex> index, EngineOptions options,
                           Clock clock)
    : ledger_(std::move(ledger)), embedder_(std::move(embedder)), index_(std::move(index)),
      options_(std::move(options)), clock_(std::move(clock)),
      ranker_(*ledger_, embedder_.get(), index_.get(), options_.retrieval),
      learner_(*this, options_.learner), sweeper_(*ledger_, index_.get()) {}

bool MemoryEngine::index_memory(const Memory &memory) {
  if (embedder_ == nullptr || index_ == nullptr) {
    return false;
  }

  const auto started = std::chrono::steady_clock::now();
  auto embedding = embedder_->embed(memory.content);
  observability::record_embedding_latency(
      std::string(embedder_->name()), std::chrono::duration_cast<std::chrono::milliseconds>(
                                          std::chrono::steady_clock::now() - started));
  if (!embedding.ok()) {
    observability::record_fallback("indexer", "memory " + std::to_string(memory.id) +
                                                  " not indexed: " + embedding.error());
    return false;
  }

  auto status =
      index_->upsert(memory.owner_id, memory.id, embedding.value(), index_metadata(memory));
  if (!status.ok()) {
    observability::record_fallback("indexer", "memory " + std::to_string(memory.id) +
                                                  " not indexed: " + status.error());
    return false;
  }
  return true;
}

common::Result<Memory> MemoryEngine::store_memory(const PersonaMemoryConfig &persona,
                                                  const NewMemory &memory) {
  if (!persona.memory_enabled) {
    return common::Result<Memory>::failure("memory is disabled for this persona",
                                           common::ErrorCode::Disabled);
  }

  auto stored = ledger_->insert(memory, clock_());
  if (!stored.ok()) {
    return stored;
  }

  const bool indexed = index_memory(stored.value());
  observability::record_memory_stored(stored.value().owner_id, stored.value().id,
                                      category_to_string(stored.value().category), indexed);
  return stored;
}

common::Result<std::vector<Memory>>
MemoryEngine::retrieve_memories(const PersonaMemoryConfig &persona, MemoryQuery query) {
  using MemoriesResult = common::Result<std::vector<Memory>>;
  if (!persona.memory_enabled || common::trim(query.owner_id).empty()) {
    return MemoriesResult::success({});
  }
  if (query.limit == 0) {
    query.limit = options_.retrieval.default_limit;
  }

  const auto started = std::chrono::steady_clock::now();
  auto ranked = ranker_.rank(query, clock_());
  observability::record_recall_latency(std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started));
  if (!ranked.ok()) {
    observability::record_error("engine", "retrieval failed: " + ranked.error());
    return MemoriesResult::success({});
  }

  observability::record_memories_recalled(query.owner_id, ranked.value().memories.size(),
                                          strategy_to_string(ranked.value().strategy));
  return MemoriesResult::success(std::move(ranked.value().memories));
}

common::Result<Memory> MemoryEngine::get_memory(const MemoryId id) {
  auto found = ledger_->get(id);
  if (!found.ok()) {
    return common::Result<Memory>::failure_from(found);
  }
  if (!found.value().has_value()) {
    return common::Result<Memory>::failure("memory " + std::to_string(id) + " not found",
                                           common::ErrorCode::NotFound);
  }
  return common::Result<Memory>::success(std::move(*found.value()));
}

common::Status MemoryEngine::delete_memory(const MemoryId id) {
  auto removed = ledger_->remove(id);
  if (!removed.ok()) {
    return common::Status::error(removed.error(), removed.code());
  }
  if (!removed.value().has_value()) {
    return common::Status::error("memory " + std::to_string(id) + " not found",
                                 common::ErrorCode::NotFound);
  }

  if (index_ != nullptr) {
    const auto &purged = *removed.value();
    auto dropped = index_->remove(purged.owner_id, purged.id);
    if (!dropped.ok()) {
      observability::record_error("engine", "index removal failed for memory " +
                                                std::to_string(id) + ": " + dropped.error());
    }
  }
  return common::Status::success();
}

common::Result<SweepReport> MemoryEngine::purge_expired(const Timestamp now) {
  return sweeper_.run(now);
}

common::Result<std::vector<ChatTurn>>
MemoryEngine::learn_from_conversation(const PersonaMemoryConfig &persona,
                                      const std::string &owner_id,
                                      const std::vector<ChatTurn> &turns) {
  if (persona.memory_enabled && persona.learning_enabled && common::trim(owner_id).empty()) {
    return common::Result<std::vector<ChatTurn>>::failure("owner_id is required",
                                                          common::ErrorCode::Validation);
  }
  return learner_.learn(persona, owner_id, turns);
}

std::string MemoryEngine::memory_context(const PersonaMemoryConfig &persona,
                                         const std::string &owner_id,
                                         const std::vector<ChatTurn> &history,
                                         const std::size_t max_memories) {
  const std::size_t limit = max_memories > 0 ? max_memories : options_.context.max_memories;
  if (!persona.memory_enabled || history.empty() || limit == 0) {
    return "";
  }

  MemoryQuery query;
  query.owner_id = owner_id;
  query.text = join_window(history, std::max<std::size_t>(1, options_.context.window_turns));
  query.limit = limit;
  query.min_importance = options_.context.min_importance;

  auto memories = retrieve_memories(persona, query);
  if (!memories.ok() || memories.value().empty()) {
    return "";
  }

  std::ostringstream out;
  out << options_.context.header << "\n";
  std::size_t position = 1;
  for (const auto &memory : memories.value()) {
    out << position++ << ". " << memory.content << "\n";
  }
  return out.str();
}

common::Result<std::size_t> MemoryEngine::reindex_owner(const std::string &owner_id,
                                                        const Timestamp now) {
  using CountResult = common::Result<std::size_t>;
  auto rows = ledger_->list_for_owner(owner_id);
  if (!rows.ok()) {
    return CountResult::failure_from(rows);
  }

  std::vector<const Memory *> live;
  std::vector<std::string> texts;
  for (const auto &memory : rows.value()) {
    if (is_expired(memory, now)) {
      continue;
    }
    live.push_back(&memory);
    texts.push_back(memory.content);
  }

  auto status = index_->drop_owner(owner_id);
  if (!status.ok()) {
    return CountResult::failure_from(status);
  }
  if (texts.empty()) {
    return CountResult::success(0);
  }

  auto embeddings = embedder_->embed_batch(texts);
  if (!embeddings.ok()) {
    return CountResult::failure_from(embeddings);
  }
  if (embeddings.value().size() != live.size()) {
    return CountResult::failure("embedder returned " +
                                    std::to_string(embeddings.value().size()) +
                                    " vectors for " + std::to_string(live.size()) + " texts",
                                common::ErrorCode::Unavailable);
  }

  std::size_t indexed = 0;
  for (std::size_t i = 0; i < live.size(); ++i) {
    auto upserted = index_->upsert(owner_id, live[i]->id, embeddings.value()[i],
                                   index_metadata(*live[i]));
    if (!upserted.ok()) {
      observability::record_error("engine", "reindex of memory " + std::to_string(live[i]->id) +
                                                " failed: " + upserted.error());
      continue;
    }
    ++indexed;
  }
  return CountResult::success(indexed);
}

common::Result<IndexRebuildReport>
MemoryEngine::rebuild_index(const std::optional<std::string> &owner_id) {
  using ReportResult = common::Result<IndexRebuildReport>;
  if (index_ == nullptr) {
    return ReportResult::failure("no vector index is configured", common::ErrorCode::Disabled);
  }
  if (embedder_ == nullptr) {
    return ReportResult::failure("no embedder is configured", common::ErrorCode::Disabled);
  }

  std::vector<std::string> owners;
  if (owner_id.has_value()) {
    owners.push_back(*owner_id);
  } else {
    auto listed = ledger_->list_owners();
    if (!listed.ok()) {
      return ReportResult::failure_from(listed);
    }
    owners = std::move(listed.value());
  }

  const Timestamp now = clock_();
  IndexRebuildReport report;
  for (const auto &owner : owners) {
    auto indexed = reindex_owner(owner, now);
    if (!indexed.ok()) {
      ++report.failures;
      observability::record_fallback("indexer", "rebuild for owner " + owner +
                                                    " failed: " + indexed.error());
      continue;
    }
    ++report.owners;
    report.entries += indexed.value();
  }

  observability::record_index_rebuilt(report.owners, report.entries, report.failures);
  observability::record_metric(observability::IndexSizeMetric{.entries = index_->total_size()});
  return ReportResult::success(report);
}

EngineStatus MemoryEngine::status() {
  EngineStatus status;
  status.ledger_backend = std::string(ledger_->name());
  status.ledger_healthy = ledger_->health_check();
  if (auto counted = ledger_->count(std::nullopt); counted.ok()) {
    status.memory_count = counted.value();
  }

  if (embedder_ != nullptr) {
    status.embedder = std::string(embedder_->name());
    status.embedder_available = status.embedder != "noop";
    status.embedding_dimensions = embedder_->dimensions();
    if (auto *cached = dynamic_cast<CachedEmbedder *>(embedder_.get()); cached != nullptr) {
      status.cache = cached->stats();
    }
  } else {
    status.embedder = "none";
  }

  if (index_ != nullptr) {
    status.index_backend = std::string(index_->name());
    status.index_entries = index_->total_size();
  } else {
    status.index_backend = "none";
  }
  return status;
}

common::Result<std::unique_ptr<MemoryEngine>> create_engine(const config::Config &config) {
  using EngineResult = common::Result<std::unique_ptr<MemoryEngine>>;

  const std::string ledger_path = config::expand_config_path(config.storage.ledger_path);
  auto ledger = SqliteLedger::open(ledger_path);
  if (!ledger.ok()) {
    return EngineResult::failure_from(ledger);
  }

  std::unique_ptr<IEmbedder> embedder = create_embedder(config);
  if (config.embedding.cache_enabled && embedder->name() != "noop") {
    const std::string cache_path =
        common::trim(config.storage.embedding_cache_path).empty()
            ? ledger_path
            : config::expand_config_path(config.storage.embedding_cache_path);
    auto cached = CachedEmbedder::open(cache_path, std::move(embedder),
                                       embedding_space_key(config), config.embedding.cache_size);
    if (cached.ok()) {
      embedder = std::move(cached.value());
    } else {
      observability::record_fallback("engine", "embedding cache unavailable: " + cached.error());
      embedder = create_embedder(config);
    }
  }

  auto index = create_vector_index(config);
  const bool can_index = index != nullptr && embedder->name() != "noop";
  auto engine = std::make_unique<MemoryEngine>(std::move(ledger.value()), std::move(embedder),
                                               std::move(index),
                                               EngineOptions::from_config(config));

  if (can_index) {
    auto rebuilt = engine->rebuild_index();
    if (!rebuilt.ok()) {
      observability::record_fallback("engine", "index rebuild skipped: " + rebuilt.error());
    }
  }
  return EngineResult::success(std::move(engine));
}

} // namespace engram::memory
