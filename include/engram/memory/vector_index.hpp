#pragma once

#include "engram/common/result.hpp"
#include "engram/config/schema.hpp"
#include "engram/memory/types.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace engram::memory {

struct VectorHit {
  MemoryId id = 0;
  float distance = 0.0F;
};

/// Per-owner nearest-neighbour collections keyed by memory id. A collection
/// exists once its first vector is written; querying an owner that has none
/// yields an empty result.
class IVectorIndex {
public:
  virtual ~IVectorIndex() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual common::Status upsert(const std::string &owner_id, MemoryId id,
                                              const std::vector<float> &embedding,
                                              const ContextMap &metadata) = 0;
  /// Up to `k` hits ordered by ascending distance.
  [[nodiscard]] virtual common::Result<std::vector<VectorHit>>
  query(const std::string &owner_id, const std::vector<float> &embedding, std::size_t k) = 0;
  [[nodiscard]] virtual common::Result<bool> remove(const std::string &owner_id, MemoryId id) = 0;
  [[nodiscard]] virtual common::Status drop_owner(const std::string &owner_id) = 0;
  [[nodiscard]] virtual std::size_t size(const std::string &owner_id) const = 0;
  [[nodiscard]] virtual std::size_t total_size() const = 0;
  [[nodiscard]] virtual bool health_check() = 0;
};

/// Exact in-memory cosine index. Distance is `1 - cosine`; equal distances
/// are ordered by id. A collection's dimension is fixed by its first vector.
class FlatVectorIndex final : public IVectorIndex {
public:
  explicit FlatVectorIndex(std::size_t max_entries_per_owner = 100'000);

  [[nodiscard]] std::string_view name() const override { return "flat"; }
  [[nodiscard]] common::Status upsert(const std::string &owner_id, MemoryId id,
                                      const std::vector<float> &embedding,
                                      const ContextMap &metadata) override;
  [[nodiscard]] common::Result<std::vector<VectorHit>>
  query(const std::string &owner_id, const std::vector<float> &embedding,
        std::size_t k) override;
  [[nodiscard]] common::Result<bool> remove(const std::string &owner_id, MemoryId id) override;
  [[nodiscard]] common::Status drop_owner(const std::string &owner_id) override;
  [[nodiscard]] std::size_t size(const std::string &owner_id) const override;
  [[nodiscard]] std::size_t total_size() const override;
  [[nodiscard]] bool health_check() override { return true; }

  [[nodiscard]] std::optional<ContextMap> metadata(const std::string &owner_id, MemoryId id) const;

private:
  struct Entry {
    std::vector<float> embedding;
    ContextMap metadata;
  };

  struct Collection {
    std::size_t dimensions = 0;
    std::map<MemoryId, Entry> entries;
  };

  std::size_t max_entries_per_owner_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, Collection> collections_;
};

[[nodiscard]] float cosine_similarity(const std::vector<float> &a, const std::vector<float> &b);

/// `index.backend = "none"` yields nullptr: retrieval then ranks from the ledger alone.
[[nodiscard]] std::unique_ptr<IVectorIndex> create_vector_index(const config::Config &config);

} // namespace engram::memory
