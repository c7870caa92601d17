#pragma once

#include "warden/common/result.hpp"

#include <filesystem>
#include <mutex>
#include <optional>
#include <sqlite3.h>
#include <string>
#include <utility>
#include <vector>

namespace warden::storage {

/// Durable key/value storage partitioned by scope (one scope per controller name).
class IStateStore {
public:
  virtual ~IStateStore() = default;

  [[nodiscard]] virtual common::Result<std::optional<std::string>> get(const std::string &scope,
                                                                       const std::string &key) = 0;
  [[nodiscard]] virtual common::Status put(const std::string &scope, const std::string &key,
                                           const std::string &value) = 0;
  /// Entries of `scope` whose key starts with `prefix`, ordered by key.
  [[nodiscard]] virtual common::Result<std::vector<std::pair<std::string, std::string>>>
  list(const std::string &scope, const std::string &prefix) = 0;
  /// Every scope holding `key`, with its value.
  [[nodiscard]] virtual common::Result<std::vector<std::pair<std::string, std::string>>>
  find_key(const std::string &key) = 0;
  [[nodiscard]] virtual common::Result<bool> remove(const std::string &scope,
                                                    const std::string &key) = 0;
  /// Removes the entry only while it still holds `expected`; false when it changed.
  [[nodiscard]] virtual common::Result<bool> remove_if_equals(const std::string &scope,
                                                              const std::string &key,
                                                              const std::string &expected) = 0;
};

class SqliteStateStore final : public IStateStore {
public:
  explicit SqliteStateStore(std::filesystem::path db_path);
  ~SqliteStateStore() override;

  SqliteStateStore(const SqliteStateStore &) = delete;
  SqliteStateStore &operator=(const SqliteStateStore &) = delete;

  [[nodiscard]] bool is_open() const { return db_ != nullptr; }
  [[nodiscard]] const std::filesystem::path &path() const { return db_path_; }

  [[nodiscard]] common::Result<std::optional<std::string>> get(const std::string &scope,
                                                               const std::string &key) override;
  [[nodiscard]] common::Status put(const std::string &scope, const std::string &key,
                                   const std::string &value) override;
  [[nodiscard]] common::Result<std::vector<std::pair<std::string, std::string>>>
  list(const std::string &scope, const std::string &prefix) override;
  [[nodiscard]] common::Result<std::vector<std::pair<std::string, std::string>>>
  find_key(const std::string &key) override;
  [[nodiscard]] common::Result<bool> remove(const std::string &scope,
                                            const std::string &key) override;
  [[nodiscard]] common::Result<bool> remove_if_equals(const std::string &scope,
                                                      const std::string &key,
                                                      const std::string &expected) override;

private:
  [[nodiscard]] common::Status init_schema();

  std::filesystem::path db_path_;
  sqlite3 *db_ = nullptr;
  std::mutex mutex_;
};

} // namespace warden::storage
