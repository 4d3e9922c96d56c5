#pragma once

#include "engram/memory/ledger.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <sqlite3.h>

namespace engram::memory {

/// Ledger in one SQLite table. One connection guarded by a mutex; every row
/// write is a single statement, so each write is atomic.
class SqliteLedger final : public ILedger {
public:
  [[nodiscard]] static common::Result<std::unique_ptr<SqliteLedger>>
  open(const std::filesystem::path &db_path);

  ~SqliteLedger() override;

  SqliteLedger(const SqliteLedger &) = delete;
  SqliteLedger &operator=(const SqliteLedger &) = delete;

  [[nodiscard]] std::string_view name() const override { return "sqlite"; }
  [[nodiscard]] common::Result<Memory> insert(const NewMemory &memory, Timestamp now) override;
  [[nodiscard]] common::Result<std::optional<Memory>> get(MemoryId id) override;
  [[nodiscard]] common::Result<std::vector<Memory>>
  query_candidates(const CandidateFilter &filter, Timestamp now) override;
  [[nodiscard]] common::Status touch(const std::vector<MemoryId> &ids, Timestamp now) override;
  [[nodiscard]] common::Result<std::vector<PurgedMemory>> purge_expired(Timestamp now) override;
  [[nodiscard]] common::Result<std::optional<PurgedMemory>> remove(MemoryId id) override;
  [[nodiscard]] common::Result<std::vector<std::string>> list_owners() override;
  [[nodiscard]] common::Result<std::vector<Memory>>
  list_for_owner(const std::string &owner_id) override;
  [[nodiscard]] common::Result<std::size_t>
  count(const std::optional<std::string> &owner_id) override;
  [[nodiscard]] bool health_check() override;

  [[nodiscard]] const std::filesystem::path &path() const { return db_path_; }

private:
  SqliteLedger(std::filesystem::path db_path, sqlite3 *db);

  [[nodiscard]] common::Status init_schema();
  [[nodiscard]] common::Result<std::vector<Memory>> read_rows(sqlite3_stmt *stmt);
  [[nodiscard]] Memory row_to_memory(sqlite3_stmt *stmt) const;

  std::filesystem::path db_path_;
  sqlite3 *db_ = nullptr;
  std::mutex mutex_;
};

} // namespace engram::memory
