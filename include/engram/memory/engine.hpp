#pragma once

#include "engram/config/schema.hpp"
#include "engram/memory/conversation_learner.hpp"
#include "engram/memory/embedder.hpp"
#include "engram/memory/embedding_cache.hpp"
#include "engram/memory/expiry_sweeper.hpp"
#include "engram/memory/ledger.hpp"
#include "engram/memory/relevance_ranker.hpp"
#include "engram/memory/vector_index.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace engram::memory {

struct EngineOptions {
  config::RetrievalConfig retrieval;
  config::ContextConfig context;
  config::LearnerConfig learner;

  [[nodiscard]] static EngineOptions from_config(const config::Config &config);
};

struct IndexRebuildReport {
  std::size_t owners = 0;
  std::size_t entries = 0;
  std::size_t failures = 0;
};

struct EngineStatus {
  std::string ledger_backend;
  bool ledger_healthy = false;
  std::size_t memory_count = 0;
  std::string embedder;
  bool embedder_available = false;
  std::size_t embedding_dimensions = 0;
  std::string index_backend;
  std::size_t index_entries = 0;
  std::optional<EmbeddingCacheStats> cache;
};

/// The memory subsystem a persona chat service talks to. Ledger writes are
/// authoritative; the embedder and index only ever improve ranking, so their
/// failures degrade retrieval to ledger order instead of failing a call.
class MemoryEngine final : public IMemoryWriter {
public:
  MemoryEngine(std::unique_ptr<ILedger> ledger, std::unique_ptr<IEmbedder> embedder,
               std::unique_ptr<IVectorIndex> index, EngineOptions options,
               Clock clock = system_now);

  MemoryEngine(const MemoryEngine &) = delete;
  MemoryEngine &operator=(const MemoryEngine &) = delete;

  /// Durable insert, then a best-effort embed and index upsert.
  [[nodiscard]] common::Result<Memory> store_memory(const PersonaMemoryConfig &persona,
                                                    const NewMemory &memory) override;

  /// Never fails on backend trouble: a disabled persona or an unreadable
  /// ledger yields an empty list. `query.limit == 0` means the configured default.
  [[nodiscard]] common::Result<std::vector<Memory>>
  retrieve_memories(const PersonaMemoryConfig &persona, MemoryQuery query);

  /// NotFound when no memory has this id.
  [[nodiscard]] common::Result<Memory> get_memory(MemoryId id);
  [[nodiscard]] common::Status delete_memory(MemoryId id);

  [[nodiscard]] common::Result<SweepReport> purge_expired(Timestamp now);

  [[nodiscard]] common::Result<std::vector<ChatTurn>>
  learn_from_conversation(const PersonaMemoryConfig &persona, const std::string &owner_id,
                          const std::vector<ChatTurn> &turns);

  /// Prompt block of memories relevant to the tail of `history`; empty when
  /// there is nothing to add. `max_memories == 0` means the configured default.
  [[nodiscard]] std::string memory_context(const PersonaMemoryConfig &persona,
                                           const std::string &owner_id,
                                           const std::vector<ChatTurn> &history,
                                           std::size_t max_memories = 0);

  /// Re-embeds ledger rows into the index, for one owner or all of them.
  [[nodiscard]] common::Result<IndexRebuildReport>
  rebuild_index(const std::optional<std::string> &owner_id = std::nullopt);

  [[nodiscard]] EngineStatus status();

  [[nodiscard]] const EngineOptions &options() const { return options_; }

private:
  [[nodiscard]] bool index_memory(const Memory &memory);
  [[nodiscard]] common::Result<std::size_t> reindex_owner(const std::string &owner_id,
                                                          Timestamp now);

  std::unique_ptr<ILedger> ledger_;
  std::unique_ptr<IEmbedder> embedder_;
  std::unique_ptr<IVectorIndex> index_;
  EngineOptions options_;
  Clock clock_;
  RelevanceRanker ranker_;
  ConversationLearner learner_;
  ExpirySweeper sweeper_;
};

/// Production wiring: SQLite ledger, configured embedder behind the persistent
/// cache, and an index rebuilt from the ledger.
[[nodiscard]] common::Result<std::unique_ptr<MemoryEngine>>
create_engine(const config::Config &config);

} // namespace engram::memory
