#pragma once

#include "engram/config/schema.hpp"
#include "engram/memory/embedder.hpp"
#include "engram/memory/ledger.hpp"
#include "engram/memory/vector_index.hpp"

namespace engram::memory {

enum class RankStrategy {
  Ledger,
  Vector,
};

[[nodiscard]] std::string strategy_to_string(RankStrategy strategy);

struct RankedMemories {
  std::vector<Memory> memories;
  RankStrategy strategy = RankStrategy::Ledger;
  // Why the vector path was skipped, when it was attempted and failed.
  std::string fallback_reason;
};

/// Orders the ledger's candidates by semantic distance to the query text and
/// falls back to (importance, recency) order whenever the embedder or index
/// cannot help. Only a ledger failure makes rank() fail.
class RelevanceRanker {
public:
  RelevanceRanker(ILedger &ledger, IEmbedder *embedder, IVectorIndex *index,
                  config::RetrievalConfig config);

  [[nodiscard]] common::Result<RankedMemories> rank(const MemoryQuery &query, Timestamp now);

private:
  [[nodiscard]] common::Result<std::vector<VectorHit>>
  semantic_hits(const MemoryQuery &query, std::size_t candidate_count);

  ILedger &ledger_;
  IEmbedder *embedder_;
  IVectorIndex *index_;
  config::RetrievalConfig config_;
};

/// Hits that name a candidate come first in hit order, then the remaining
/// candidates in their given order; the result is cut to `limit`. Ids of the
/// hits that matched a candidate are appended to `matched` when given.
[[nodiscard]] std::vector<Memory> merge_ranked(const std::vector<Memory> &candidates,
                                               const std::vector<VectorHit> &hits,
                                               std::size_t limit,
                                               std::vector<MemoryId> *matched = nullptr);

} // namespace engram::memory
