#include "engram/memory/sqlite_ledger.hpp"

#include "engram/common/fs.hpp"
#include "engram/common/json_util.hpp"
#include "engram/memory/sqlite_util.hpp"

#include <sstream>

namespace engram::memory {

namespace {

constexpr const char *kSelectColumns =
    "SELECT id, owner_id, category, content, context, importance, created_at, "
    "last_accessed_at, expires_at FROM persona_memories";

common::Status storage_error(sqlite3 *db) {
  return common::Status::error(sqlite3_errmsg(db), common::ErrorCode::Storage);
}

template <typename T> common::Result<T> storage_failure(sqlite3 *db) {
  return common::Result<T>::failure(sqlite3_errmsg(db), common::ErrorCode::Storage);
}

} // namespace

common::Status validate_new_memory(const NewMemory &memory) {
  if (common::trim(memory.owner_id).empty()) {
    return common::Status::error("owner_id is required", common::ErrorCode::Validation);
  }
  if (common::trim(memory.content).empty()) {
    return common::Status::error("content must not be empty", common::ErrorCode::Validation);
  }
  return common::Status::success();
}

common::Result<std::unique_ptr<SqliteLedger>>
SqliteLedger::open(const std::filesystem::path &db_path) {
  using OpenResult = common::Result<std::unique_ptr<SqliteLedger>>;

  auto db = sqlite::open_database(db_path);
  if (!db.ok()) {
    return OpenResult::failure_from(db);
  }

  std::unique_ptr<SqliteLedger> ledger(new SqliteLedger(db_path, db.value()));
  if (auto status = ledger->init_schema(); !status.ok()) {
    return OpenResult::failure_from(status);
  }
  return OpenResult::success(std::move(ledger));
}

SqliteLedger::SqliteLedger(std::filesystem::path db_path, sqlite3 *db)
    : db_path_(std::move(db_path)), db_(db) {}

SqliteLedger::~SqliteLedger() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

common::Status SqliteLedger::init_schema() {
  auto status = sqlite::exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS persona_memories (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  owner_id TEXT NOT NULL,
  category TEXT NOT NULL DEFAULT 'conversation',
  content TEXT NOT NULL,
  context TEXT NOT NULL DEFAULT '{}',
  importance REAL NOT NULL DEFAULT 1.0,
  created_at INTEGER NOT NULL,
  last_accessed_at INTEGER NOT NULL,
  expires_at INTEGER
);
)");
  if (!status.ok()) {
    return status;
  }

  status = sqlite::exec_sql(db_, R"(
CREATE INDEX IF NOT EXISTS idx_persona_memories_owner
  ON persona_memories(owner_id, importance DESC, last_accessed_at DESC);
)");
  if (!status.ok()) {
    return status;
  }

  return sqlite::exec_sql(db_, R"(
CREATE INDEX IF NOT EXISTS idx_persona_memories_expiry
  ON persona_memories(expires_at) WHERE expires_at IS NOT NULL;
)");
}

Memory SqliteLedger::row_to_memory(sqlite3_stmt *stmt) const {
  Memory memory;
  memory.id = sqlite3_column_int64(stmt, 0);
  memory.owner_id = sqlite::column_text(stmt, 1);
  memory.category =
      parse_category(sqlite::column_text(stmt, 2)).value_or(MemoryCategory::Conversation);
  memory.content = sqlite::column_text(stmt, 3);
  memory.context = common::json_parse_flat(sqlite::column_text(stmt, 4));
  memory.importance = sqlite3_column_double(stmt, 5);
  memory.created_at = from_epoch_micros(sqlite3_column_int64(stmt, 6));
  memory.last_accessed_at = from_epoch_micros(sqlite3_column_int64(stmt, 7));
  if (sqlite3_column_type(stmt, 8) != SQLITE_NULL) {
    memory.expires_at = from_epoch_micros(sqlite3_column_int64(stmt, 8));
  }
  return memory;
}

common::Result<std::vector<Memory>> SqliteLedger::read_rows(sqlite3_stmt *stmt) {
  std::vector<Memory> rows;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    rows.push_back(row_to_memory(stmt));
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return storage_failure<std::vector<Memory>>(db_);
  }
  return common::Result<std::vector<Memory>>::success(std::move(rows));
}

common::Result<Memory> SqliteLedger::insert(const NewMemory &memory, const Timestamp now) {
  if (auto valid = validate_new_memory(memory); !valid.ok()) {
    return common::Result<Memory>::failure_from(valid);
  }

  Memory stored;
  stored.owner_id = memory.owner_id;
  stored.category = memory.category;
  stored.content = memory.content;
  stored.context = memory.context;
  stored.importance = clamp_importance(memory.importance);
  stored.created_at = now;
  stored.last_accessed_at = now;
  stored.expires_at = memory.expires_at;

  const std::string context_json = common::json_write_flat(stored.context);
  const std::string category = category_to_string(stored.category);

  std::lock_guard<std::mutex> lock(mutex_);
  sqlite3_stmt *stmt = nullptr;
  const char *sql = "INSERT INTO persona_memories(owner_id, category, content, context, "
                    "importance, created_at, last_accessed_at, expires_at) "
                    "VALUES(?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8)";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return storage_failure<Memory>(db_);
  }

  sqlite3_bind_text(stmt, 1, stored.owner_id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 2, category.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 3, stored.content.c_str(), static_cast<int>(stored.content.size()),
                    SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 4, context_json.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_double(stmt, 5, stored.importance);
  sqlite3_bind_int64(stmt, 6, to_epoch_micros(now));
  sqlite3_bind_int64(stmt, 7, to_epoch_micros(now));
  if (stored.expires_at.has_value()) {
    sqlite3_bind_int64(stmt, 8, to_epoch_micros(*stored.expires_at));
  } else {
    sqlite3_bind_null(stmt, 8);
  }

  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return storage_failure<Memory>(db_);
  }

  stored.id = sqlite3_last_insert_rowid(db_);
  return common::Result<Memory>::success(std::move(stored));
}

common::Result<std::optional<Memory>> SqliteLedger::get(const MemoryId id) {
  using GetResult = common::Result<std::optional<Memory>>;

  std::lock_guard<std::mutex> lock(mutex_);
  sqlite3_stmt *stmt = nullptr;
  const std::string sql = std::string(kSelectColumns) + " WHERE id = ?1";
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    return storage_failure<std::optional<Memory>>(db_);
  }
  sqlite3_bind_int64(stmt, 1, id);

  auto rows = read_rows(stmt);
  if (!rows.ok()) {
    return GetResult::failure_from(rows);
  }
  if (rows.value().empty()) {
    return GetResult::success(std::nullopt);
  }
  return GetResult::success(std::move(rows.value().front()));
}

common::Result<std::vector<Memory>> SqliteLedger::query_candidates(const CandidateFilter &filter,
                                                                   const Timestamp now) {
  std::ostringstream sql;
  sql << kSelectColumns
      << " WHERE owner_id = ?1 AND importance >= ?2"
         " AND (expires_at IS NULL OR expires_at > ?3)";
  if (!filter.categories.empty()) {
    sql << " AND category IN (";
    for (std::size_t i = 0; i < filter.categories.size(); ++i) {
      sql << (i == 0 ? "" : ", ") << "?" << (i + 4);
    }
    sql << ")";
  }
  sql << " ORDER BY importance DESC, last_accessed_at DESC, id DESC";

  std::lock_guard<std::mutex> lock(mutex_);
  sqlite3_stmt *stmt = nullptr;
  const std::string query = sql.str();
  if (sqlite3_prepare_v2(db_, query.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    return storage_failure<std::vector<Memory>>(db_);
  }
  sqlite3_bind_text(stmt, 1, filter.owner_id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_double(stmt, 2, filter.min_importance);
  sqlite3_bind_int64(stmt, 3, to_epoch_micros(now));
  for (std::size_t i = 0; i < filter.categories.size(); ++i) {
    const std::string category = category_to_string(filter.categories[i]);
    sqlite3_bind_text(stmt, static_cast<int>(i + 4), category.c_str(), -1, SQLITE_TRANSIENT);
  }

  return read_rows(stmt);
}

common::Status SqliteLedger::touch(const std::vector<MemoryId> &ids, const Timestamp now) {
  if (ids.empty()) {
    return common::Status::success();
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (auto status = sqlite::exec_sql(db_, "BEGIN IMMEDIATE;"); !status.ok()) {
    return status;
  }

  sqlite3_stmt *stmt = nullptr;
  const char *sql = "UPDATE persona_memories SET last_accessed_at = ?1 WHERE id = ?2";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    auto status = storage_error(db_);
    (void)sqlite::exec_sql(db_, "ROLLBACK;");
    return status;
  }

  const std::int64_t stamp = to_epoch_micros(now);
  for (const MemoryId id : ids) {
    sqlite3_bind_int64(stmt, 1, stamp);
    sqlite3_bind_int64(stmt, 2, id);
    if (sqlite3_step(stmt) != SQLITE_DONE) {
      auto status = storage_error(db_);
      sqlite3_finalize(stmt);
      (void)sqlite::exec_sql(db_, "ROLLBACK;");
      return status;
    }
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
  }
  sqlite3_finalize(stmt);

  if (auto status = sqlite::exec_sql(db_, "COMMIT;"); !status.ok()) {
    (void)sqlite::exec_sql(db_, "ROLLBACK;");
    return status;
  }
  return common::Status::success();
}

common::Result<std::vector<PurgedMemory>> SqliteLedger::purge_expired(const Timestamp now) {
  using PurgeResult = common::Result<std::vector<PurgedMemory>>;

  std::lock_guard<std::mutex> lock(mutex_);
  if (auto status = sqlite::exec_sql(db_, "BEGIN IMMEDIATE;"); !status.ok()) {
    return PurgeResult::failure_from(status);
  }

  const auto rollback = [this](const common::Status &status) {
    (void)sqlite::exec_sql(db_, "ROLLBACK;");
    return PurgeResult::failure_from(status);
  };

  const std::int64_t stamp = to_epoch_micros(now);
  std::vector<PurgedMemory> purged;

  sqlite3_stmt *select = nullptr;
  const char *select_sql = "SELECT id, owner_id FROM persona_memories "
                           "WHERE expires_at IS NOT NULL AND expires_at <= ?1 ORDER BY id";
  if (sqlite3_prepare_v2(db_, select_sql, -1, &select, nullptr) != SQLITE_OK) {
    return rollback(storage_error(db_));
  }
  sqlite3_bind_int64(select, 1, stamp);
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(select)) == SQLITE_ROW) {
    purged.push_back(PurgedMemory{.id = sqlite3_column_int64(select, 0),
                                  .owner_id = sqlite::column_text(select, 1)});
  }
  sqlite3_finalize(select);
  if (rc != SQLITE_DONE) {
    return rollback(storage_error(db_));
  }

  sqlite3_stmt *del = nullptr;
  const char *delete_sql =
      "DELETE FROM persona_memories WHERE expires_at IS NOT NULL AND expires_at <= ?1";
  if (sqlite3_prepare_v2(db_, delete_sql, -1, &del, nullptr) != SQLITE_OK) {
    return rollback(storage_error(db_));
  }
  sqlite3_bind_int64(del, 1, stamp);
  rc = sqlite3_step(del);
  sqlite3_finalize(del);
  if (rc != SQLITE_DONE) {
    return rollback(storage_error(db_));
  }

  if (auto status = sqlite::exec_sql(db_, "COMMIT;"); !status.ok()) {
    return rollback(status);
  }
  return PurgeResult::success(std::move(purged));
}

common::Result<std::optional<PurgedMemory>> SqliteLedger::remove(const MemoryId id) {
  using RemoveResult = common::Result<std::optional<PurgedMemory>>;

  std::lock_guard<std::mutex> lock(mutex_);
  sqlite3_stmt *stmt = nullptr;
  const char *sql = "DELETE FROM persona_memories WHERE id = ?1 RETURNING owner_id";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return storage_failure<std::optional<PurgedMemory>>(db_);
  }
  sqlite3_bind_int64(stmt, 1, id);

  std::optional<PurgedMemory> removed;
  int rc = sqlite3_step(stmt);
  if (rc == SQLITE_ROW) {
    removed = PurgedMemory{.id = id, .owner_id = sqlite::column_text(stmt, 0)};
    rc = sqlite3_step(stmt);
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return storage_failure<std::optional<PurgedMemory>>(db_);
  }
  return RemoveResult::success(std::move(removed));
}

common::Result<std::vector<std::string>> SqliteLedger::list_owners() {
  using OwnersResult = common::Result<std::vector<std::string>>;

  std::lock_guard<std::mutex> lock(mutex_);
  sqlite3_stmt *stmt = nullptr;
  const char *sql = "SELECT DISTINCT owner_id FROM persona_memories ORDER BY owner_id";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return storage_failure<std::vector<std::string>>(db_);
  }

  std::vector<std::string> owners;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    owners.push_back(sqlite::column_text(stmt, 0));
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return storage_failure<std::vector<std::string>>(db_);
  }
  return OwnersResult::success(std::move(owners));
}

common::Result<std::vector<Memory>> SqliteLedger::list_for_owner(const std::string &owner_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  sqlite3_stmt *stmt = nullptr;
  const std::string sql = std::string(kSelectColumns) + " WHERE owner_id = ?1 ORDER BY id";
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    return storage_failure<std::vector<Memory>>(db_);
  }
  sqlite3_bind_text(stmt, 1, owner_id.c_str(), -1, SQLITE_TRANSIENT);
  return read_rows(stmt);
}

common::Result<std::size_t> SqliteLedger::count(const std::optional<std::string> &owner_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  sqlite3_stmt *stmt = nullptr;
  const char *sql = owner_id.has_value()
                        ? "SELECT COUNT(*) FROM persona_memories WHERE owner_id = ?1"
                        : "SELECT COUNT(*) FROM persona_memories";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return storage_failure<std::size_t>(db_);
  }
  if (owner_id.has_value()) {
    sqlite3_bind_text(stmt, 1, owner_id->c_str(), -1, SQLITE_TRANSIENT);
  }

  std::size_t total = 0;
  const int rc = sqlite3_step(stmt);
  if (rc == SQLITE_ROW) {
    total = static_cast<std::size_t>(sqlite3_column_int64(stmt, 0));
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_ROW) {
    return storage_failure<std::size_t>(db_);
  }
  return common::Result<std::size_t>::success(total);
}

bool SqliteLedger::health_check() {
  std::lock_guard<std::mutex> lock(mutex_);
  return sqlite::exec_sql(db_, "SELECT 1;").ok();
}

} // namespace engram::memory
