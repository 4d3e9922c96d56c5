#pragma once

#include "engram/common/result.hpp"

#include <filesystem>
#include <sqlite3.h>
#include <string>
#include <vector>

namespace engram::memory::sqlite {

/// Opens (creating parent directories) a database in WAL mode with a busy timeout.
[[nodiscard]] common::Result<sqlite3 *> open_database(const std::filesystem::path &path);

[[nodiscard]] common::Status exec_sql(sqlite3 *db, const std::string &sql);

[[nodiscard]] std::vector<unsigned char> vector_to_blob(const std::vector<float> &values);
[[nodiscard]] std::vector<float> blob_to_vector(const void *blob, int bytes);

[[nodiscard]] std::string column_text(sqlite3_stmt *stmt, int column);

} // namespace engram::memory::sqlite
