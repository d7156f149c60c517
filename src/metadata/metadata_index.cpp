#include "memorybank/metadata/metadata_index.hpp"

#include "memorybank/common/fs.hpp"
#include "memorybank/common/hash.hpp"
#include "memorybank/common/time.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <mutex>
#include <set>
#include <sstream>

namespace memorybank::metadata {

namespace {

std::vector<std::string> normalize_tags(const std::vector<std::string> &raw) {
  std::set<std::string> unique;
  for (const auto &tag : raw) {
    const std::string trimmed = common::trim(tag);
    if (!trimmed.empty()) {
      unique.insert(trimmed);
    }
  }
  return {unique.begin(), unique.end()};
}

std::optional<std::string> header_timestamp(const FrontMatter &header, const std::string &key) {
  const auto raw = header.get_string(key);
  if (!raw.has_value()) {
    return std::nullopt;
  }
  return common::normalize_timestamp(*raw);
}

bool has_all_tags(const IndexEntry &entry, const std::vector<std::string> &required) {
  for (const auto &tag : required) {
    const std::string wanted = common::to_lower(tag);
    const bool found = std::any_of(entry.tags.begin(), entry.tags.end(), [&](const std::string &t) {
      return common::to_lower(t) == wanted;
    });
    if (!found) {
      return false;
    }
  }
  return true;
}

bool in_time_range(const std::string &value, const std::optional<std::string> &after,
                   const std::optional<std::string> &before) {
  const auto target = common::parse_rfc3339(value);
  if (!target.has_value()) {
    return !after.has_value() && !before.has_value();
  }
  if (after.has_value()) {
    if (const auto bound = common::parse_rfc3339(*after); bound.has_value() && *target < *bound) {
      return false;
    }
  }
  if (before.has_value()) {
    if (const auto bound = common::parse_rfc3339(*before); bound.has_value() && *target > *bound) {
      return false;
    }
  }
  return true;
}

bool contains_text(const IndexEntry &entry, const std::string &needle) {
  if (needle.empty()) {
    return true;
  }
  return common::to_lower(entry.title).find(needle) != std::string::npos ||
         common::to_lower(entry.description).find(needle) != std::string::npos ||
         common::to_lower(entry.relative_path).find(needle) != std::string::npos;
}

bool matches(const IndexEntry &entry, const IndexFilter &filter, const std::string &needle) {
  if (!has_all_tags(entry, filter.tags)) {
    return false;
  }
  if (filter.type.has_value() && entry.type != *filter.type) {
    return false;
  }
  if (filter.validation_status.has_value() && entry.validation_status != *filter.validation_status) {
    return false;
  }
  if ((filter.created_after || filter.created_before) &&
      !in_time_range(entry.created, filter.created_after, filter.created_before)) {
    return false;
  }
  if ((filter.updated_after || filter.updated_before) &&
      !in_time_range(entry.updated, filter.updated_after, filter.updated_before)) {
    return false;
  }
  if (filter.min_size.has_value() && entry.size_bytes < *filter.min_size) {
    return false;
  }
  if (filter.max_size.has_value() && entry.size_bytes > *filter.max_size) {
    return false;
  }
  return contains_text(entry, needle);
}

void sort_entries(std::vector<IndexEntry> &entries, const SortField field, const bool descending) {
  const auto key_less = [field](const IndexEntry &a, const IndexEntry &b) {
    switch (field) {
    case SortField::Title:
      return common::to_lower(a.title) < common::to_lower(b.title);
    case SortField::Created:
      return a.created < b.created;
    case SortField::Updated:
      return a.updated < b.updated;
    case SortField::Size:
      return a.size_bytes < b.size_bytes;
    case SortField::Path:
      break;
    }
    return a.relative_path < b.relative_path;
  };

  std::sort(entries.begin(), entries.end(), [&](const IndexEntry &a, const IndexEntry &b) {
    if (key_less(a, b)) {
      return !descending;
    }
    if (key_less(b, a)) {
      return descending;
    }
    return a.relative_path < b.relative_path;
  });
}

} // namespace

std::size_t count_lines(const std::string &content) {
  if (content.empty()) {
    return 0;
  }
  return static_cast<std::size_t>(std::count(content.begin(), content.end(), '\n')) + 1;
}

std::size_t count_words(const std::string &content) {
  std::istringstream stream(content);
  std::size_t count = 0;
  std::string word;
  while (stream >> word) {
    ++count;
  }
  return count;
}

MetadataIndex::MetadataIndex(std::shared_ptr<const SchemaRegistry> schemas)
    : schemas_(schemas != nullptr
                   ? std::move(schemas)
                   : std::make_shared<const SchemaRegistry>(SchemaRegistry::with_defaults())) {}

IndexEntry MetadataIndex::build_entry(const std::string &relative_path, const std::string &content,
                                      const std::optional<std::string> &modified_at,
                                      const IndexEntry *previous) const {
  const auto parsed = parse_document(content);
  const auto &header = parsed.header;
  const std::string now = common::now_rfc3339();
  const auto fallback_time = modified_at.has_value() ? common::normalize_timestamp(*modified_at)
                                                     : std::optional<std::string>{};

  IndexEntry entry;
  entry.relative_path = relative_path;
  entry.size_bytes = content.size();
  entry.line_count = count_lines(content);
  entry.word_count = count_words(parsed.body);
  entry.last_indexed = now;

  entry.id = header.get_string("id").value_or("sha256:" + common::sha256_hex(relative_path));
  entry.type = header.get_string("type").value_or("unknown");
  entry.title = header.get_string("title").value_or(
      std::filesystem::path(relative_path).stem().string());
  entry.description = header.get_string("description").value_or("");
  entry.tags = normalize_tags(header.get_list("tags"));

  if (const auto created = header_timestamp(header, "created"); created.has_value()) {
    entry.created = *created;
  } else if (previous != nullptr && !previous->created.empty()) {
    entry.created = previous->created;
  } else {
    entry.created = fallback_time.value_or(now);
  }
  entry.updated = header_timestamp(header, "updated").value_or(fallback_time.value_or(now));
  if (previous != nullptr && previous->updated > entry.updated) {
    entry.updated = previous->updated;
  }

  if (parsed.has_header && !parsed.header_valid) {
    entry.validation_status = ValidationStatus::Unknown;
    entry.validation_errors.push_back("front matter could not be parsed: " + parsed.parse_error);
  } else {
    auto validation = schemas_->validate(header);
    entry.validation_status = validation.status;
    entry.validation_errors = std::move(validation.errors);
  }
  return entry;
}

IndexEntry MetadataIndex::upsert(const std::string &relative_path, const std::string &content,
                                 const std::optional<std::string> &modified_at) {
  std::optional<IndexEntry> previous;
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (const auto it = entries_.find(relative_path); it != entries_.end()) {
      previous = it->second;
    }
  }

  IndexEntry entry =
      build_entry(relative_path, content, modified_at, previous ? &*previous : nullptr);

  std::unique_lock<std::shared_mutex> lock(mutex_);
  if (const auto it = entries_.find(relative_path); it != entries_.end()) {
    if (it->second.updated > entry.updated) {
      entry.updated = it->second.updated;
    }
  }
  entries_[relative_path] = entry;
  return entry;
}

bool MetadataIndex::remove(const std::string &relative_path) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  return entries_.erase(relative_path) > 0;
}

void MetadataIndex::rebuild_all(const std::vector<IndexSource> &sources) {
  std::unordered_map<std::string, IndexEntry> previous;
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    previous = entries_;
  }

  std::unordered_map<std::string, IndexEntry> rebuilt;
  rebuilt.reserve(sources.size());
  for (const auto &source : sources) {
    const auto it = previous.find(source.relative_path);
    rebuilt[source.relative_path] =
        build_entry(source.relative_path, source.content, source.modified_at,
                    it == previous.end() ? nullptr : &it->second);
  }

  std::unique_lock<std::shared_mutex> lock(mutex_);
  entries_.swap(rebuilt);
  last_rebuild_ = common::now_rfc3339();
}

void MetadataIndex::restore(std::vector<IndexEntry> entries) {
  std::unordered_map<std::string, IndexEntry> restored;
  restored.reserve(entries.size());
  for (auto &entry : entries) {
    std::string key = entry.relative_path;
    restored[key] = std::move(entry);
  }

  std::unique_lock<std::shared_mutex> lock(mutex_);
  entries_.swap(restored);
}

void MetadataIndex::clear() {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  entries_.clear();
}

std::optional<IndexEntry> MetadataIndex::get(const std::string &relative_path) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  const auto it = entries_.find(relative_path);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second;
}

QueryResult MetadataIndex::query(const IndexFilter &filter) const {
  const std::string needle = common::to_lower(common::trim(filter.text));
  std::vector<IndexEntry> matched;
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (const auto &[_, entry] : entries_) {
      if (matches(entry, filter, needle)) {
        matched.push_back(entry);
      }
    }
  }

  sort_entries(matched, filter.sort_by, filter.descending);

  QueryResult result;
  result.total = matched.size();
  result.offset = filter.offset;
  result.limit = filter.limit;
  if (filter.offset < matched.size()) {
    const auto remaining = matched.size() - filter.offset;
    const auto end = filter.offset + std::min(remaining, filter.limit);
    result.entries.assign(std::make_move_iterator(matched.begin() + static_cast<std::ptrdiff_t>(filter.offset)),
                          std::make_move_iterator(matched.begin() + static_cast<std::ptrdiff_t>(end)));
    result.has_more = end < matched.size();
  }
  return result;
}

std::vector<IndexEntry> MetadataIndex::recently_updated(const std::size_t limit) const {
  auto entries = snapshot();
  sort_entries(entries, SortField::Updated, true);
  if (entries.size() > limit) {
    entries.resize(limit);
  }
  return entries;
}

std::vector<IndexEntry> MetadataIndex::largest(const std::size_t limit) const {
  auto entries = snapshot();
  sort_entries(entries, SortField::Size, true);
  if (entries.size() > limit) {
    entries.resize(limit);
  }
  return entries;
}

std::map<std::string, std::size_t> MetadataIndex::all_tags() const {
  std::map<std::string, std::size_t> counts;
  std::shared_lock<std::shared_mutex> lock(mutex_);
  for (const auto &[_, entry] : entries_) {
    for (const auto &tag : entry.tags) {
      ++counts[tag];
    }
  }
  return counts;
}

std::map<std::string, std::size_t> MetadataIndex::all_types() const {
  std::map<std::string, std::size_t> counts;
  std::shared_lock<std::shared_mutex> lock(mutex_);
  for (const auto &[_, entry] : entries_) {
    ++counts[entry.type];
  }
  return counts;
}

std::vector<IndexEntry> MetadataIndex::snapshot() const {
  std::vector<IndexEntry> out;
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    out.reserve(entries_.size());
    for (const auto &[_, entry] : entries_) {
      out.push_back(entry);
    }
  }
  sort_entries(out, SortField::Path, false);
  return out;
}

IndexStats MetadataIndex::stats() const {
  IndexStats out;
  std::shared_lock<std::shared_mutex> lock(mutex_);
  out.total_entries = entries_.size();
  out.last_rebuild = last_rebuild_;
  for (const auto &[_, entry] : entries_) {
    out.total_size_bytes += entry.size_bytes;
    switch (entry.validation_status) {
    case ValidationStatus::Valid:
      ++out.valid;
      break;
    case ValidationStatus::Invalid:
      ++out.invalid;
      break;
    case ValidationStatus::Unknown:
      ++out.unknown;
      break;
    }
    ++out.type_counts[entry.type];
    for (const auto &tag : entry.tags) {
      ++out.tag_counts[tag];
    }
  }
  out.total_size = common::format_bytes(out.total_size_bytes);
  return out;
}

std::size_t MetadataIndex::size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return entries_.size();
}

} // namespace memorybank::metadata
