#include "engram/memory/relevance_ranker.hpp"

#include "engram/common/fs.hpp"
#include "engram/observability/global.hpp"

#include <algorithm>
#include <chrono>
#include <set>
#include <unordered_map>
#include <unordered_set>

namespace engram::memory {

std::string strategy_to_string(const RankStrategy strategy) {
  return strategy == RankStrategy::Vector ? "vector" : "ledger";
}

std::vector<Memory> merge_ranked(const std::vector<Memory> &candidates,
                                 const std::vector<VectorHit> &hits, const std::size_t limit,
                                 std::vector<MemoryId> *matched) {
  std::unordered_map<MemoryId, std::size_t> position;
  position.reserve(candidates.size());
  for (std::size_t i = 0; i < candidates.size(); ++i) {
    position.emplace(candidates[i].id, i);
  }

  std::vector<Memory> ranked;
  ranked.reserve(std::min(limit, candidates.size()));
  std::unordered_set<MemoryId> seen;

  for (const auto &hit : hits) {
    const auto it = position.find(hit.id);
    if (it == position.end() || seen.contains(hit.id)) {
      continue;
    }
    seen.insert(hit.id);
    if (matched != nullptr) {
      matched->push_back(hit.id);
    }
    if (ranked.size() < limit) {
      ranked.push_back(candidates[it->second]);
    }
  }

  for (const auto &candidate : candidates) {
    if (ranked.size() >= limit) {
      break;
    }
    if (!seen.contains(candidate.id)) {
      ranked.push_back(candidate);
    }
  }
  return ranked;
}

RelevanceRanker::RelevanceRanker(ILedger &ledger, IEmbedder *embedder, IVectorIndex *index,
                                 config::RetrievalConfig config)
    : ledger_(ledger), embedder_(embedder), index_(index), config_(config) {}

common::Result<std::vector<VectorHit>>
RelevanceRanker::semantic_hits(const MemoryQuery &query, const std::size_t candidate_count) {
  using HitsResult = common::Result<std::vector<VectorHit>>;

  const auto started = std::chrono::steady_clock::now();
  auto embedding = embedder_->embed(query.text);
  observability::record_embedding_latency(
      std::string(embedder_->name()), std::chrono::duration_cast<std::chrono::milliseconds>(
                                          std::chrono::steady_clock::now() - started));
  if (!embedding.ok()) {
    return HitsResult::failure("embedder: " + embedding.error(), embedding.code());
  }

  const std::size_t multiplier = std::max<std::size_t>(1, config_.candidate_multiplier);
  const std::size_t k = std::min(candidate_count, query.limit * multiplier);
  auto hits = index_->query(query.owner_id, embedding.value(), k);
  if (!hits.ok()) {
    return HitsResult::failure("vector index: " + hits.error(), hits.code());
  }
  return hits;
}

common::Result<RankedMemories> RelevanceRanker::rank(const MemoryQuery &query,
                                                     const Timestamp now) {
  auto candidates = ledger_.query_candidates(
      CandidateFilter{.owner_id = query.owner_id,
                      .categories = query.categories,
                      .min_importance = query.min_importance},
      now);
  if (!candidates.ok()) {
    return common::Result<RankedMemories>::failure_from(candidates);
  }

  RankedMemories result;
  if (candidates.value().empty() || query.limit == 0) {
    return common::Result<RankedMemories>::success(std::move(result));
  }

  std::vector<MemoryId> matched;
  const bool semantic = embedder_ != nullptr && index_ != nullptr &&
                        !common::trim(query.text).empty();
  if (semantic) {
    auto hits = semantic_hits(query, candidates.value().size());
    if (hits.ok()) {
      result.memories = merge_ranked(candidates.value(), hits.value(), query.limit, &matched);
      result.strategy = RankStrategy::Vector;
    } else {
      result.fallback_reason = hits.error();
      observability::record_fallback("ranker", hits.error());
    }
  }
  if (result.strategy == RankStrategy::Ledger) {
    auto &all = candidates.value();
    if (all.size() > query.limit) {
      all.resize(query.limit);
    }
    result.memories = std::move(all);
  }

  // Every vector match and every returned memory counts as accessed.
  std::set<MemoryId> touched(matched.begin(), matched.end());
  for (const auto &memory : result.memories) {
    touched.insert(memory.id);
  }
  if (auto status = ledger_.touch(std::vector<MemoryId>(touched.begin(), touched.end()), now);
      status.ok()) {
    for (auto &memory : result.memories) {
      memory.last_accessed_at = now;
    }
  } else {
    observability::record_error("ranker", "touch failed: " + status.error());
  }

  return common::Result<RankedMemories>::success(std::move(result));
}

} // namespace engram::memory
