#include "engram/memory/embedding_cache.hpp"

#include "engram/memory/sqlite_util.hpp"
#include "engram/memory/types.hpp"
#include "engram/observability/global.hpp"

#include <openssl/sha.h>

#include <iomanip>
#include <sstream>

namespace engram::memory {

namespace {

std::string sha256_hex(const std::string &text) {
  unsigned char digest[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char *>(text.data()), text.size(), digest);

  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (const unsigned char c : digest) {
    stream << std::setw(2) << static_cast<int>(c);
  }
  return stream.str();
}

} // namespace

common::Result<std::unique_ptr<CachedEmbedder>>
CachedEmbedder::open(const std::filesystem::path &db_path, std::unique_ptr<IEmbedder> inner,
                     std::string space_key, const std::size_t max_entries) {
  using OpenResult = common::Result<std::unique_ptr<CachedEmbedder>>;
  if (inner == nullptr) {
    return OpenResult::failure("embedding cache needs an embedder", common::ErrorCode::Validation);
  }

  auto db = sqlite::open_database(db_path);
  if (!db.ok()) {
    return OpenResult::failure_from(db);
  }

  auto status = sqlite::exec_sql(db.value(), R"(
CREATE TABLE IF NOT EXISTS embedding_cache (
  text_hash TEXT PRIMARY KEY,
  embedding BLOB NOT NULL,
  created_at INTEGER NOT NULL
);
)");
  if (!status.ok()) {
    sqlite3_close(db.value());
    return OpenResult::failure_from(status);
  }

  std::unique_ptr<CachedEmbedder> cache(
      new CachedEmbedder(db.value(), std::move(inner), std::move(space_key), max_entries));
  return OpenResult::success(std::move(cache));
}

CachedEmbedder::CachedEmbedder(sqlite3 *db, std::unique_ptr<IEmbedder> inner,
                               std::string space_key, const std::size_t max_entries)
    : db_(db), inner_(std::move(inner)), space_key_(std::move(space_key)),
      max_entries_(max_entries) {}

CachedEmbedder::~CachedEmbedder() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

std::string_view CachedEmbedder::name() const { return inner_->name(); }

std::size_t CachedEmbedder::dimensions() const { return inner_->dimensions(); }

std::string CachedEmbedder::cache_key(const std::string_view text) const {
  return sha256_hex(space_key_ + "\n" + std::string(text));
}

common::Result<std::optional<std::vector<float>>> CachedEmbedder::lookup(const std::string &key) {
  using LookupResult = common::Result<std::optional<std::vector<float>>>;

  sqlite3_stmt *stmt = nullptr;
  const char *sql = "SELECT embedding FROM embedding_cache WHERE text_hash = ?1";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return LookupResult::failure(sqlite3_errmsg(db_), common::ErrorCode::Storage);
  }
  sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);

  std::optional<std::vector<float>> found;
  const int rc = sqlite3_step(stmt);
  if (rc == SQLITE_ROW) {
    auto embedding =
        sqlite::blob_to_vector(sqlite3_column_blob(stmt, 0), sqlite3_column_bytes(stmt, 0));
    if (embedding.size() == inner_->dimensions()) {
      found = std::move(embedding);
    }
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
    return LookupResult::failure(sqlite3_errmsg(db_), common::ErrorCode::Storage);
  }
  return LookupResult::success(std::move(found));
}

common::Status CachedEmbedder::insert(const std::string &key,
                                      const std::vector<float> &embedding) {
  if (max_entries_ == 0) {
    return common::Status::success();
  }
  const auto blob = sqlite::vector_to_blob(embedding);

  sqlite3_stmt *stmt = nullptr;
  const char *sql = "INSERT OR REPLACE INTO embedding_cache(text_hash, embedding, created_at) "
                    "VALUES(?1, ?2, ?3)";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Status::error(sqlite3_errmsg(db_), common::ErrorCode::Storage);
  }
  sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_blob(stmt, 2, blob.data(), static_cast<int>(blob.size()), SQLITE_TRANSIENT);
  sqlite3_bind_int64(stmt, 3, to_epoch_micros(system_now()));
  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Status::error(sqlite3_errmsg(db_), common::ErrorCode::Storage);
  }

  sqlite3_stmt *count_stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM embedding_cache", -1, &count_stmt, nullptr) ==
      SQLITE_OK) {
    if (sqlite3_step(count_stmt) == SQLITE_ROW) {
      stats_.entries = static_cast<std::size_t>(sqlite3_column_int64(count_stmt, 0));
    }
    sqlite3_finalize(count_stmt);
  }

  if (stats_.entries > max_entries_) {
    const std::size_t overflow = stats_.entries - max_entries_;
    std::ostringstream trim_sql;
    trim_sql << "DELETE FROM embedding_cache WHERE text_hash IN ("
             << "SELECT text_hash FROM embedding_cache ORDER BY created_at ASC, rowid ASC LIMIT "
             << overflow << ")";
    if (auto trim_status = sqlite::exec_sql(db_, trim_sql.str()); !trim_status.ok()) {
      return trim_status;
    }
    stats_.entries = max_entries_;
  }

  return common::Status::success();
}

common::Result<std::vector<float>> CachedEmbedder::embed(const std::string_view text) {
  const std::string key = cache_key(text);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto cached = lookup(key);
    if (!cached.ok()) {
      observability::record_error("embedding_cache", cached.error());
    } else if (cached.value().has_value()) {
      ++stats_.hits;
      return common::Result<std::vector<float>>::success(std::move(*cached.value()));
    }
    ++stats_.misses;
  }

  auto embedded = inner_->embed(text);
  if (!embedded.ok()) {
    return embedded;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (auto status = insert(key, embedded.value()); !status.ok()) {
    observability::record_error("embedding_cache", status.error());
  }
  return embedded;
}

common::Result<std::vector<std::vector<float>>>
CachedEmbedder::embed_batch(const std::vector<std::string> &texts) {
  using BatchResult = common::Result<std::vector<std::vector<float>>>;

  std::vector<std::vector<float>> out(texts.size());
  std::vector<std::size_t> missing;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (std::size_t i = 0; i < texts.size(); ++i) {
      auto cached = lookup(cache_key(texts[i]));
      if (cached.ok() && cached.value().has_value()) {
        ++stats_.hits;
        out[i] = std::move(*cached.value());
      } else {
        ++stats_.misses;
        missing.push_back(i);
      }
    }
  }
  if (missing.empty()) {
    return BatchResult::success(std::move(out));
  }

  std::vector<std::string> pending;
  pending.reserve(missing.size());
  for (const std::size_t index : missing) {
    pending.push_back(texts[index]);
  }
  auto embedded = inner_->embed_batch(pending);
  if (!embedded.ok()) {
    return embedded;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  for (std::size_t i = 0; i < missing.size(); ++i) {
    const std::size_t index = missing[i];
    out[index] = std::move(embedded.value()[i]);
    if (auto status = insert(cache_key(texts[index]), out[index]); !status.ok()) {
      observability::record_error("embedding_cache", status.error());
    }
  }
  return BatchResult::success(std::move(out));
}

EmbeddingCacheStats CachedEmbedder::stats() {
  std::lock_guard<std::mutex> lock(mutex_);
  sqlite3_stmt *count_stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM embedding_cache", -1, &count_stmt, nullptr) ==
      SQLITE_OK) {
    if (sqlite3_step(count_stmt) == SQLITE_ROW) {
      stats_.entries = static_cast<std::size_t>(sqlite3_column_int64(count_stmt, 0));
    }
    sqlite3_finalize(count_stmt);
  }
  return stats_;
}

common::Status CachedEmbedder::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  auto status = sqlite::exec_sql(db_, "DELETE FROM embedding_cache;");
  if (status.ok()) {
    stats_.entries = 0;
  }
  return status;
}

} // namespace engram::memory
