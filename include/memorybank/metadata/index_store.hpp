#pragma once

#include "memorybank/common/result.hpp"
#include "memorybank/metadata/metadata_index.hpp"

#include <filesystem>
#include <mutex>
#include <optional>
#include <sqlite3.h>
#include <string>
#include <vector>

namespace memorybank::metadata {

// Persists index entries between runs in a single sqlite file.
class IndexStore {
public:
  explicit IndexStore(std::filesystem::path db_path);
  ~IndexStore();

  IndexStore(const IndexStore &) = delete;
  IndexStore &operator=(const IndexStore &) = delete;

  [[nodiscard]] common::Status open();
  void close();
  [[nodiscard]] bool is_open() const;

  // Replaces all stored entries in one transaction.
  [[nodiscard]] common::Status save(const std::vector<IndexEntry> &entries);
  [[nodiscard]] common::Result<std::vector<IndexEntry>> load();
  [[nodiscard]] common::Result<std::optional<std::string>> last_build_time();

  [[nodiscard]] const std::filesystem::path &path() const { return db_path_; }

private:
  [[nodiscard]] common::Status init_schema();
  [[nodiscard]] common::Status write_entry(sqlite3_stmt *stmt, const IndexEntry &entry);

  std::filesystem::path db_path_;
  sqlite3 *db_ = nullptr;
  mutable std::mutex mutex_;
};

} // namespace memorybank::metadata
