#pragma once

#include "memorybank/metadata/schema.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace memorybank::metadata {

struct IndexEntry {
  std::string relative_path;
  std::string id;
  std::string type;
  std::string title;
  std::string description;
  // Sorted, duplicates removed.
  std::vector<std::string> tags;
  ValidationStatus validation_status = ValidationStatus::Unknown;
  std::vector<std::string> validation_errors;
  std::uintmax_t size_bytes = 0;
  std::size_t line_count = 0;
  std::size_t word_count = 0;
  std::string created;
  std::string updated;
  std::string last_indexed;
};

enum class SortField { Path, Title, Created, Updated, Size };

struct IndexFilter {
  // Entry must carry every tag (case-insensitive).
  std::vector<std::string> tags;
  std::optional<std::string> type;
  std::optional<ValidationStatus> validation_status;
  std::optional<std::string> created_after;
  std::optional<std::string> created_before;
  std::optional<std::string> updated_after;
  std::optional<std::string> updated_before;
  std::optional<std::uintmax_t> min_size;
  std::optional<std::uintmax_t> max_size;
  // Case-insensitive substring over title, description and path.
  std::string text;
  SortField sort_by = SortField::Path;
  bool descending = false;
  std::size_t offset = 0;
  std::size_t limit = 50;
};

struct QueryResult {
  std::vector<IndexEntry> entries;
  std::size_t total = 0;
  std::size_t offset = 0;
  std::size_t limit = 0;
  bool has_more = false;
};

struct IndexSource {
  std::string relative_path;
  std::string content;
  std::optional<std::string> modified_at;
};

struct IndexStats {
  std::size_t total_entries = 0;
  std::uintmax_t total_size_bytes = 0;
  std::string total_size;
  std::size_t valid = 0;
  std::size_t invalid = 0;
  std::size_t unknown = 0;
  std::map<std::string, std::size_t> tag_counts;
  std::map<std::string, std::size_t> type_counts;
  std::string last_rebuild;
};

[[nodiscard]] std::size_t count_lines(const std::string &content);
[[nodiscard]] std::size_t count_words(const std::string &content);

class MetadataIndex {
public:
  explicit MetadataIndex(std::shared_ptr<const SchemaRegistry> schemas = nullptr);

  // Never fails: unparseable headers produce a minimal entry.
  IndexEntry upsert(const std::string &relative_path, const std::string &content,
                    const std::optional<std::string> &modified_at = std::nullopt);
  bool remove(const std::string &relative_path);
  // Builds a fresh map and swaps it in; readers see either the old or the new index.
  void rebuild_all(const std::vector<IndexSource> &sources);
  void restore(std::vector<IndexEntry> entries);
  void clear();

  [[nodiscard]] std::optional<IndexEntry> get(const std::string &relative_path) const;
  [[nodiscard]] QueryResult query(const IndexFilter &filter) const;
  [[nodiscard]] std::vector<IndexEntry> recently_updated(std::size_t limit = 10) const;
  [[nodiscard]] std::vector<IndexEntry> largest(std::size_t limit = 10) const;
  [[nodiscard]] std::map<std::string, std::size_t> all_tags() const;
  [[nodiscard]] std::map<std::string, std::size_t> all_types() const;
  [[nodiscard]] std::vector<IndexEntry> snapshot() const;
  [[nodiscard]] IndexStats stats() const;
  [[nodiscard]] std::size_t size() const;

  [[nodiscard]] const SchemaRegistry &schemas() const { return *schemas_; }

private:
  [[nodiscard]] IndexEntry build_entry(const std::string &relative_path, const std::string &content,
                                       const std::optional<std::string> &modified_at,
                                       const IndexEntry *previous) const;

  std::shared_ptr<const SchemaRegistry> schemas_;
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, IndexEntry> entries_;
  std::string last_rebuild_;
};

} // namespace memorybank::metadata
