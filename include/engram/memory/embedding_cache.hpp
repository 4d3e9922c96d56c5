#pragma once

#include "engram/memory/embedder.hpp"

#include <filesystem>
#include <mutex>
#include <sqlite3.h>

namespace engram::memory {

struct EmbeddingCacheStats {
  std::size_t entries = 0;
  std::size_t hits = 0;
  std::size_t misses = 0;
};

/// Decorates an embedder with a persistent SQLite cache keyed by
/// SHA-256(space_key + text). Oldest rows are evicted beyond `max_entries`.
/// Cache errors never fail an embed call; they fall through to the inner embedder.
class CachedEmbedder final : public IEmbedder {
public:
  [[nodiscard]] static common::Result<std::unique_ptr<CachedEmbedder>>
  open(const std::filesystem::path &db_path, std::unique_ptr<IEmbedder> inner,
       std::string space_key, std::size_t max_entries);

  ~CachedEmbedder() override;

  CachedEmbedder(const CachedEmbedder &) = delete;
  CachedEmbedder &operator=(const CachedEmbedder &) = delete;

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] common::Result<std::vector<float>> embed(std::string_view text) override;
  [[nodiscard]] common::Result<std::vector<std::vector<float>>>
  embed_batch(const std::vector<std::string> &texts) override;
  [[nodiscard]] std::size_t dimensions() const override;

  [[nodiscard]] EmbeddingCacheStats stats();
  [[nodiscard]] common::Status clear();

private:
  CachedEmbedder(sqlite3 *db, std::unique_ptr<IEmbedder> inner, std::string space_key,
                 std::size_t max_entries);

  [[nodiscard]] std::string cache_key(std::string_view text) const;
  [[nodiscard]] common::Result<std::optional<std::vector<float>>> lookup(const std::string &key);
  [[nodiscard]] common::Status insert(const std::string &key, const std::vector<float> &embedding);

  sqlite3 *db_ = nullptr;
  std::mutex mutex_;
  std::unique_ptr<IEmbedder> inner_;
  std::string space_key_;
  std::size_t max_entries_;
  EmbeddingCacheStats stats_;
};

} // namespace engram::memory
