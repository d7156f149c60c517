#include "memorybank/metadata/index_store.hpp"

#include "memorybank/common/time.hpp"

namespace memorybank::metadata {

namespace {

constexpr char LIST_SEPARATOR = '\x1f';

common::Status sqlite_error(sqlite3 *db, const std::string &context) {
  return common::Status::error(common::ErrorCode::IndexStoreError, context,
                               db == nullptr ? std::string("database is not open")
                                             : std::string(sqlite3_errmsg(db)));
}

common::Status exec_sql(sqlite3 *db, const std::string &sql) {
  char *err = nullptr;
  const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string msg = err == nullptr ? "sqlite error" : err;
    if (err != nullptr) {
      sqlite3_free(err);
    }
    return common::Status::error(common::ErrorCode::IndexStoreError, "sqlite exec failed", msg);
  }
  return common::Status::success();
}

std::string join_list(const std::vector<std::string> &items) {
  std::string out;
  for (std::size_t i = 0; i < items.size(); ++i) {
    if (i > 0) {
      out.push_back(LIST_SEPARATOR);
    }
    out += items[i];
  }
  return out;
}

std::vector<std::string> split_list(const std::string &joined) {
  std::vector<std::string> out;
  if (joined.empty()) {
    return out;
  }
  std::size_t start = 0;
  while (true) {
    const auto pos = joined.find(LIST_SEPARATOR, start);
    out.push_back(joined.substr(start, pos == std::string::npos ? std::string::npos : pos - start));
    if (pos == std::string::npos) {
      break;
    }
    start = pos + 1;
  }
  return out;
}

std::string column_text(sqlite3_stmt *stmt, const int column) {
  const auto *text = sqlite3_column_text(stmt, column);
  return text == nullptr ? std::string() : std::string(reinterpret_cast<const char *>(text));
}

} // namespace

IndexStore::IndexStore(std::filesystem::path db_path) : db_path_(std::move(db_path)) {}

IndexStore::~IndexStore() { close(); }

common::Status IndexStore::open() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ != nullptr) {
    return common::Status::success();
  }

  std::error_code ec;
  std::filesystem::create_directories(db_path_.parent_path(), ec);
  if (ec) {
    return common::Status::error(common::ErrorCode::IndexStoreError,
                                 "Failed to create index directory", ec.message());
  }

  if (sqlite3_open(db_path_.string().c_str(), &db_) != SQLITE_OK) {
    auto status = sqlite_error(db_, "Failed to open index database " + db_path_.string());
    sqlite3_close(db_);
    db_ = nullptr;
    return status;
  }
  sqlite3_busy_timeout(db_, 2000);

  auto status = init_schema();
  if (!status.ok()) {
    sqlite3_close(db_);
    db_ = nullptr;
  }
  return status;
}

void IndexStore::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ != nullptr) {
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

bool IndexStore::is_open() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return db_ != nullptr;
}

common::Status IndexStore::init_schema() {
  auto status = exec_sql(db_, "PRAGMA journal_mode=WAL;");
  if (!status.ok()) {
    return status;
  }

  status = exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS index_entries (
  relative_path TEXT PRIMARY KEY,
  id TEXT NOT NULL,
  type TEXT NOT NULL,
  title TEXT NOT NULL,
  description TEXT NOT NULL,
  tags TEXT NOT NULL,
  validation_status TEXT NOT NULL,
  validation_errors TEXT NOT NULL,
  size_bytes INTEGER NOT NULL,
  line_count INTEGER NOT NULL,
  word_count INTEGER NOT NULL,
  created TEXT NOT NULL,
  updated TEXT NOT NULL,
  last_indexed TEXT NOT NULL
);
)");
  if (!status.ok()) {
    return status;
  }

  return exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS index_meta (
  key TEXT PRIMARY KEY,
  value TEXT NOT NULL
);
)");
}

common::Status IndexStore::write_entry(sqlite3_stmt *stmt, const IndexEntry &entry) {
  const std::string tags = join_list(entry.tags);
  const std::string errors = join_list(entry.validation_errors);
  const std::string status(to_string(entry.validation_status));

  sqlite3_reset(stmt);
  sqlite3_clear_bindings(stmt);
  sqlite3_bind_text(stmt, 1, entry.relative_path.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 2, entry.id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 3, entry.type.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 4, entry.title.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 5, entry.description.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 6, tags.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 7, status.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 8, errors.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(stmt, 9, static_cast<sqlite3_int64>(entry.size_bytes));
  sqlite3_bind_int64(stmt, 10, static_cast<sqlite3_int64>(entry.line_count));
  sqlite3_bind_int64(stmt, 11, static_cast<sqlite3_int64>(entry.word_count));
  sqlite3_bind_text(stmt, 12, entry.created.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 13, entry.updated.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 14, entry.last_indexed.c_str(), -1, SQLITE_TRANSIENT);

  if (sqlite3_step(stmt) != SQLITE_DONE) {
    return sqlite_error(db_, "Failed to store index entry " + entry.relative_path);
  }
  return common::Status::success();
}

common::Status IndexStore::save(const std::vector<IndexEntry> &entries) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return sqlite_error(db_, "Index store is not open");
  }

  auto status = exec_sql(db_, "BEGIN IMMEDIATE;");
  if (!status.ok()) {
    return status;
  }

  const auto rollback = [this](common::Status failure) {
    (void)exec_sql(db_, "ROLLBACK;");
    return failure;
  };

  status = exec_sql(db_, "DELETE FROM index_entries;");
  if (!status.ok()) {
    return rollback(status);
  }

  sqlite3_stmt *stmt = nullptr;
  const char *sql = R"(
INSERT INTO index_entries(relative_path, id, type, title, description, tags, validation_status,
                          validation_errors, size_bytes, line_count, word_count, created, updated,
                          last_indexed)
VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12, ?13, ?14)
)";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return rollback(sqlite_error(db_, "Failed to prepare index insert"));
  }
  for (const auto &entry : entries) {
    status = write_entry(stmt, entry);
    if (!status.ok()) {
      sqlite3_finalize(stmt);
      return rollback(status);
    }
  }
  sqlite3_finalize(stmt);

  const std::string built_at = common::now_rfc3339();
  stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "INSERT OR REPLACE INTO index_meta(key, value) VALUES('last_build', ?1)",
                         -1, &stmt, nullptr) != SQLITE_OK) {
    return rollback(sqlite_error(db_, "Failed to prepare index metadata update"));
  }
  sqlite3_bind_text(stmt, 1, built_at.c_str(), -1, SQLITE_TRANSIENT);
  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return rollback(sqlite_error(db_, "Failed to record index build time"));
  }

  status = exec_sql(db_, "COMMIT;");
  if (!status.ok()) {
    return rollback(status);
  }
  return common::Status::success();
}

common::Result<std::vector<IndexEntry>> IndexStore::load() {
  using EntriesResult = common::Result<std::vector<IndexEntry>>;
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return EntriesResult::failure(sqlite_error(db_, "Index store is not open").details());
  }

  sqlite3_stmt *stmt = nullptr;
  const char *sql = R"(
SELECT relative_path, id, type, title, description, tags, validation_status, validation_errors,
       size_bytes, line_count, word_count, created, updated, last_indexed
FROM index_entries ORDER BY relative_path
)";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return EntriesResult::failure(sqlite_error(db_, "Failed to prepare index load").details());
  }

  std::vector<IndexEntry> entries;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    IndexEntry entry;
    entry.relative_path = column_text(stmt, 0);
    entry.id = column_text(stmt, 1);
    entry.type = column_text(stmt, 2);
    entry.title = column_text(stmt, 3);
    entry.description = column_text(stmt, 4);
    entry.tags = split_list(column_text(stmt, 5));
    entry.validation_status =
        validation_status_from_string(column_text(stmt, 6)).value_or(ValidationStatus::Unknown);
    entry.validation_errors = split_list(column_text(stmt, 7));
    entry.size_bytes = static_cast<std::uintmax_t>(sqlite3_column_int64(stmt, 8));
    entry.line_count = static_cast<std::size_t>(sqlite3_column_int64(stmt, 9));
    entry.word_count = static_cast<std::size_t>(sqlite3_column_int64(stmt, 10));
    entry.created = column_text(stmt, 11);
    entry.updated = column_text(stmt, 12);
    entry.last_indexed = column_text(stmt, 13);
    entries.push_back(std::move(entry));
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return EntriesResult::failure(sqlite_error(db_, "Failed to read index entries").details());
  }
  return EntriesResult::success(std::move(entries));
}

common::Result<std::optional<std::string>> IndexStore::last_build_time() {
  using TimeResult = common::Result<std::optional<std::string>>;
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return TimeResult::failure(sqlite_error(db_, "Index store is not open").details());
  }

  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "SELECT value FROM index_meta WHERE key = 'last_build'", -1, &stmt,
                         nullptr) != SQLITE_OK) {
    return TimeResult::failure(sqlite_error(db_, "Failed to prepare build time query").details());
  }

  std::optional<std::string> value;
  const int rc = sqlite3_step(stmt);
  if (rc == SQLITE_ROW) {
    value = column_text(stmt, 0);
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
    return TimeResult::failure(sqlite_error(db_, "Failed to read build time").details());
  }
  return TimeResult::success(std::move(value));
}

} // namespace memorybank::metadata
