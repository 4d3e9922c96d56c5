#include "engram/memory/vector_index.hpp"

#include "engram/common/fs.hpp"

#include <algorithm>
#include <cmath>

namespace engram::memory {

float cosine_similarity(const std::vector<float> &a, const std::vector<float> &b) {
  if (a.empty() || b.empty() || a.size() != b.size()) {
    return 0.0F;
  }

  double dot = 0.0;
  double norm_a = 0.0;
  double norm_b = 0.0;

  for (std::size_t i = 0; i < a.size(); ++i) {
    dot += static_cast<double>(a[i]) * static_cast<double>(b[i]);
    norm_a += static_cast<double>(a[i]) * static_cast<double>(a[i]);
    norm_b += static_cast<double>(b[i]) * static_cast<double>(b[i]);
  }

  if (norm_a < 1e-9 || norm_b < 1e-9) {
    return 0.0F;
  }

  return static_cast<float>(dot / (std::sqrt(norm_a) * std::sqrt(norm_b)));
}

FlatVectorIndex::FlatVectorIndex(const std::size_t max_entries_per_owner)
    : max_entries_per_owner_(max_entries_per_owner) {}

common::Status FlatVectorIndex::upsert(const std::string &owner_id, const MemoryId id,
                                       const std::vector<float> &embedding,
                                       const ContextMap &metadata) {
  if (owner_id.empty()) {
    return common::Status::error("owner_id is required", common::ErrorCode::Validation);
  }
  if (embedding.empty()) {
    return common::Status::error("embedding is empty", common::ErrorCode::Validation);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  auto &collection = collections_[owner_id];
  if (collection.entries.empty()) {
    collection.dimensions = embedding.size();
  }
  if (embedding.size() != collection.dimensions) {
    return common::Status::error("embedding dimensions mismatch: collection " + owner_id +
                                     " holds " + std::to_string(collection.dimensions) +
                                     ", got " + std::to_string(embedding.size()),
                                 common::ErrorCode::Validation);
  }
  if (!collection.entries.contains(id) && collection.entries.size() >= max_entries_per_owner_) {
    return common::Status::error("vector collection full for " + owner_id,
                                 common::ErrorCode::Unavailable);
  }
  collection.entries[id] = Entry{.embedding = embedding, .metadata = metadata};
  return common::Status::success();
}

common::Result<std::vector<VectorHit>>
FlatVectorIndex::query(const std::string &owner_id, const std::vector<float> &embedding,
                       const std::size_t k) {
  using QueryResult = common::Result<std::vector<VectorHit>>;

  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = collections_.find(owner_id);
  if (it == collections_.end() || it->second.entries.empty() || k == 0) {
    return QueryResult::success({});
  }
  const auto &collection = it->second;
  if (embedding.size() != collection.dimensions) {
    return QueryResult::failure("query dimensions mismatch", common::ErrorCode::Validation);
  }

  std::vector<VectorHit> hits;
  hits.reserve(collection.entries.size());
  for (const auto &[id, entry] : collection.entries) {
    hits.push_back(VectorHit{
        .id = id,
        .distance = 1.0F - cosine_similarity(embedding, entry.embedding),
    });
  }

  const std::size_t keep = std::min(k, hits.size());
  std::partial_sort(hits.begin(), hits.begin() + static_cast<long>(keep), hits.end(),
                    [](const VectorHit &lhs, const VectorHit &rhs) {
                      if (lhs.distance != rhs.distance) {
                        return lhs.distance < rhs.distance;
                      }
                      return lhs.id < rhs.id;
                    });
  hits.resize(keep);
  return QueryResult::success(std::move(hits));
}

common::Result<bool> FlatVectorIndex::remove(const std::string &owner_id, const MemoryId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = collections_.find(owner_id);
  if (it == collections_.end()) {
    return common::Result<bool>::success(false);
  }
  const bool removed = it->second.entries.erase(id) > 0;
  if (it->second.entries.empty()) {
    collections_.erase(it);
  }
  return common::Result<bool>::success(removed);
}

common::Status FlatVectorIndex::drop_owner(const std::string &owner_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  collections_.erase(owner_id);
  return common::Status::success();
}

std::size_t FlatVectorIndex::size(const std::string &owner_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = collections_.find(owner_id);
  return it == collections_.end() ? 0 : it->second.entries.size();
}

std::size_t FlatVectorIndex::total_size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t total = 0;
  for (const auto &[owner, collection] : collections_) {
    total += collection.entries.size();
  }
  return total;
}

std::optional<ContextMap> FlatVectorIndex::metadata(const std::string &owner_id,
                                                    const MemoryId id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = collections_.find(owner_id);
  if (it == collections_.end()) {
    return std::nullopt;
  }
  const auto entry = it->second.entries.find(id);
  if (entry == it->second.entries.end()) {
    return std::nullopt;
  }
  return entry->second.metadata;
}

std::unique_ptr<IVectorIndex> create_vector_index(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.index.backend));
  if (backend == "none") {
    return nullptr;
  }
  return std::make_unique<FlatVectorIndex>(config.index.max_entries_per_owner);
}

} // namespace engram::memory
