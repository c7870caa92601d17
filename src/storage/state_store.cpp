#include "warden/storage/state_store.hpp"

namespace warden::storage {

namespace {

using Rows = std::vector<std::pair<std::string, std::string>>;

common::Status exec_sql(sqlite3 *db, const std::string &sql) {
  char *err = nullptr;
  const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string message = err == nullptr ? "sqlite error" : err;
    if (err != nullptr) {
      sqlite3_free(err);
    }
    return common::Status::error(message);
  }
  return common::Status::success();
}

std::string column_text(sqlite3_stmt *stmt, const int column) {
  const auto *text = reinterpret_cast<const char *>(sqlite3_column_text(stmt, column));
  return text == nullptr ? std::string() : std::string(text);
}

// Escapes LIKE wildcards so a key prefix matches literally.
std::string like_prefix(const std::string &prefix) {
  std::string out;
  out.reserve(prefix.size() + 1);
  for (const char ch : prefix) {
    if (ch == '%' || ch == '_' || ch == '\\') {
      out.push_back('\\');
    }
    out.push_back(ch);
  }
  out.push_back('%');
  return out;
}

common::Result<Rows> collect_rows(sqlite3 *db, sqlite3_stmt *stmt) {
  Rows rows;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    rows.emplace_back(column_text(stmt, 0), column_text(stmt, 1));
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Result<Rows>::failure(sqlite3_errmsg(db));
  }
  return common::Result<Rows>::success(std::move(rows));
}

} // namespace

SqliteStateStore::SqliteStateStore(std::filesystem::path db_path) : db_path_(std::move(db_path)) {
  std::error_code ec;
  if (db_path_.has_parent_path()) {
    std::filesystem::create_directories(db_path_.parent_path(), ec);
  }
  if (sqlite3_open(db_path_.string().c_str(), &db_) != SQLITE_OK) {
    if (db_ != nullptr) {
      sqlite3_close(db_);
    }
    db_ = nullptr;
    return;
  }
  sqlite3_busy_timeout(db_, 5000);
  if (!init_schema().ok()) {
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

SqliteStateStore::~SqliteStateStore() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

common::Status SqliteStateStore::init_schema() {
  return exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS state_entries (
  scope TEXT NOT NULL,
  key TEXT NOT NULL,
  value TEXT NOT NULL,
  updated_at INTEGER NOT NULL DEFAULT (strftime('%s','now')),
  PRIMARY KEY (scope, key)
);
CREATE INDEX IF NOT EXISTS state_entries_key ON state_entries(key);
)");
}

common::Result<std::optional<std::string>> SqliteStateStore::get(const std::string &scope,
                                                                  const std::string &key) {
  using ResultT = common::Result<std::optional<std::string>>;
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return ResultT::failure("state db not initialized");
  }

  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "SELECT value FROM state_entries WHERE scope = ?1 AND key = ?2", -1,
                         &stmt, nullptr) != SQLITE_OK) {
    return ResultT::failure(sqlite3_errmsg(db_));
  }
  sqlite3_bind_text(stmt, 1, scope.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 2, key.c_str(), -1, SQLITE_TRANSIENT);

  const int rc = sqlite3_step(stmt);
  std::optional<std::string> value;
  if (rc == SQLITE_ROW) {
    value = column_text(stmt, 0);
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
    return ResultT::failure(sqlite3_errmsg(db_));
  }
  return ResultT::success(std::move(value));
}

common::Status SqliteStateStore::put(const std::string &scope, const std::string &key,
                                     const std::string &value) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Status::error("state db not initialized");
  }

  sqlite3_stmt *stmt = nullptr;
  const char *sql = "INSERT OR REPLACE INTO state_entries(scope, key, value, updated_at) "
                    "VALUES(?1, ?2, ?3, strftime('%s','now'))";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Status::error(sqlite3_errmsg(db_));
  }
  sqlite3_bind_text(stmt, 1, scope.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 2, key.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 3, value.c_str(), -1, SQLITE_TRANSIENT);

  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Status::error(sqlite3_errmsg(db_));
  }
  return common::Status::success();
}

common::Result<Rows> SqliteStateStore::list(const std::string &scope, const std::string &prefix) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<Rows>::failure("state db not initialized");
  }

  sqlite3_stmt *stmt = nullptr;
  const char *sql = "SELECT key, value FROM state_entries "
                    "WHERE scope = ?1 AND key LIKE ?2 ESCAPE '\\' ORDER BY key";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<Rows>::failure(sqlite3_errmsg(db_));
  }
  const std::string pattern = like_prefix(prefix);
  sqlite3_bind_text(stmt, 1, scope.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 2, pattern.c_str(), -1, SQLITE_TRANSIENT);
  return collect_rows(db_, stmt);
}

common::Result<Rows> SqliteStateStore::find_key(const std::string &key) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<Rows>::failure("state db not initialized");
  }

  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "SELECT scope, value FROM state_entries WHERE key = ?1 ORDER BY scope",
                         -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<Rows>::failure(sqlite3_errmsg(db_));
  }
  sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
  return collect_rows(db_, stmt);
}

common::Result<bool> SqliteStateStore::remove(const std::string &scope, const std::string &key) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<bool>::failure("state db not initialized");
  }

  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "DELETE FROM state_entries WHERE scope = ?1 AND key = ?2", -1, &stmt,
                         nullptr) != SQLITE_OK) {
    return common::Result<bool>::failure(sqlite3_errmsg(db_));
  }
  sqlite3_bind_text(stmt, 1, scope.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 2, key.c_str(), -1, SQLITE_TRANSIENT);
  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Result<bool>::failure(sqlite3_errmsg(db_));
  }
  return common::Result<bool>::success(sqlite3_changes(db_) > 0);
}

common::Result<bool> SqliteStateStore::remove_if_equals(const std::string &scope,
                                                        const std::string &key,
                                                        const std::string &expected) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<bool>::failure("state db not initialized");
  }

  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_,
                         "DELETE FROM state_entries WHERE scope = ?1 AND key = ?2 AND value = ?3",
                         -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<bool>::failure(sqlite3_errmsg(db_));
  }
  sqlite3_bind_text(stmt, 1, scope.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 2, key.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 3, expected.c_str(), -1, SQLITE_TRANSIENT);
  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Result<bool>::failure(sqlite3_errmsg(db_));
  }
  return common::Result<bool>::success(sqlite3_changes(db_) > 0);
}

} // namespace warden::storage
