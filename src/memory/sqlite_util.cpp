#include "engram/memory/sqlite_util.hpp"

#include <cstring>

namespace engram::memory::sqlite {

common::Result<sqlite3 *> open_database(const std::filesystem::path &path) {
  if (path.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      return common::Result<sqlite3 *>::failure("Failed to create directory for " +
                                                    path.string() + ": " + ec.message(),
                                                common::ErrorCode::Storage);
    }
  }

  sqlite3 *db = nullptr;
  if (sqlite3_open(path.string().c_str(), &db) != SQLITE_OK) {
    const std::string message = db == nullptr ? "out of memory" : sqlite3_errmsg(db);
    if (db != nullptr) {
      sqlite3_close(db);
    }
    return common::Result<sqlite3 *>::failure("Unable to open " + path.string() + ": " + message,
                                              common::ErrorCode::Storage);
  }

  sqlite3_busy_timeout(db, 5'000);
  if (auto status = exec_sql(db, "PRAGMA journal_mode=WAL;"); !status.ok()) {
    sqlite3_close(db);
    return common::Result<sqlite3 *>::failure_from(status);
  }
  return common::Result<sqlite3 *>::success(db);
}

common::Status exec_sql(sqlite3 *db, const std::string &sql) {
  char *err = nullptr;
  const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string msg = err == nullptr ? "sqlite error" : err;
    if (err != nullptr) {
      sqlite3_free(err);
    }
    return common::Status::error(msg, common::ErrorCode::Storage);
  }
  return common::Status::success();
}

std::vector<unsigned char> vector_to_blob(const std::vector<float> &values) {
  std::vector<unsigned char> blob(values.size() * sizeof(float));
  if (!blob.empty()) {
    std::memcpy(blob.data(), values.data(), blob.size());
  }
  return blob;
}

std::vector<float> blob_to_vector(const void *blob, const int bytes) {
  if (blob == nullptr || bytes <= 0 || (bytes % static_cast<int>(sizeof(float)) != 0)) {
    return {};
  }

  const std::size_t length = static_cast<std::size_t>(bytes) / sizeof(float);
  std::vector<float> values(length);
  std::memcpy(values.data(), blob, static_cast<std::size_t>(bytes));
  return values;
}

std::string column_text(sqlite3_stmt *stmt, const int column) {
  const auto *text = sqlite3_column_text(stmt, column);
  if (text == nullptr) {
    return "";
  }
  return std::string(reinterpret_cast<const char *>(text),
                     static_cast<std::size_t>(sqlite3_column_bytes(stmt, column)));
}

} // namespace engram::memory::sqlite
