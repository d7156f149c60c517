#pragma once

#include "memorybank/common/result.hpp"
#include "memorybank/config/schema.hpp"
#include "memorybank/core/templates.hpp"
#include "memorybank/metadata/frontmatter.hpp"
#include "memorybank/metadata/index_store.hpp"
#include "memorybank/metadata/metadata_index.hpp"
#include "memorybank/observability/observer.hpp"
#include "memorybank/storage/cache_manager.hpp"
#include "memorybank/storage/file_operations.hpp"
#include "memorybank/storage/file_types.hpp"
#include "memorybank/storage/path_validator.hpp"
#include "memorybank/storage/streaming_reader.hpp"

#include <array>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace memorybank::core {

struct MemoryBankFile {
  storage::FileType type = storage::FileType::ProjectBrief;
  std::string relative_path;
  std::filesystem::path absolute_path;
  // Exactly what is stored on disk, header included.
  std::string content;
  std::string body;
  metadata::FrontMatter metadata;
  metadata::ValidationStatus validation_status = metadata::ValidationStatus::Unknown;
  std::string last_updated;
};

struct MemoryBankFileStats {
  storage::FileType type = storage::FileType::ProjectBrief;
  std::uintmax_t size_bytes = 0;
  std::string size;
  std::string created;
  std::string updated;
};

struct HealthReport {
  bool healthy = false;
  std::vector<std::string> issues;
  std::string summary;
};

struct MemoryBankOptions {
  std::filesystem::path root;
  storage::RetryPolicy retry;
  storage::CacheOptions cache;
  config::IndexConfig index;
  storage::StreamingOptions streaming;

  [[nodiscard]] static common::Result<MemoryBankOptions> from_config(const config::Config &config);
};

struct MemoryBankDependencies {
  std::shared_ptr<observability::IObserver> observer;
  std::shared_ptr<storage::IFileSystem> file_system;
  templates::TemplateProvider template_provider;
  std::shared_ptr<const metadata::SchemaRegistry> schemas;
};

class MemoryBank {
public:
  explicit MemoryBank(MemoryBankOptions options, MemoryBankDependencies deps = {});
  ~MemoryBank();

  MemoryBank(const MemoryBank &) = delete;
  MemoryBank &operator=(const MemoryBank &) = delete;

  // Creates folders, opens the index store and restores or rebuilds the index.
  [[nodiscard]] common::Status init();
  // Persists the index and drops every in-memory view. Safe to call twice.
  [[nodiscard]] common::Status dispose();

  [[nodiscard]] common::Status initialize_folders();
  // Returns the types that were missing and got created from templates.
  [[nodiscard]] common::Result<std::vector<storage::FileType>> load_files();

  [[nodiscard]] std::optional<MemoryBankFile> get_file(storage::FileType type) const;
  [[nodiscard]] std::vector<MemoryBankFile> get_all_files() const;
  [[nodiscard]] std::string files_with_filenames() const;
  [[nodiscard]] common::Result<std::vector<MemoryBankFileStats>> file_stats();

  [[nodiscard]] common::Status update_file(storage::FileType type, const std::string &content);
  [[nodiscard]] common::Status write_file_by_path(const std::string &relative_path,
                                                  const std::string &content);
  [[nodiscard]] common::Result<std::string> read_file_by_path(const std::string &relative_path);
  // Uncached read that switches to chunked streaming for large files.
  [[nodiscard]] common::Result<storage::StreamingResult>
  stream_file_by_path(const std::string &relative_path, const storage::StreamingProgress &progress = {});
  [[nodiscard]] storage::StreamingStats streaming_stats() const;

  [[nodiscard]] common::Result<std::string> check_health();
  [[nodiscard]] HealthReport diagnose();

  [[nodiscard]] common::Status invalidate_cache(const std::optional<std::string> &relative_path = std::nullopt);
  [[nodiscard]] storage::CacheStats cache_stats() const;
  void reset_cache_stats();
  [[nodiscard]] storage::CacheUsage cache_usage() const;

  [[nodiscard]] metadata::QueryResult search(const metadata::IndexFilter &filter) const;
  [[nodiscard]] common::Status rebuild_index();
  [[nodiscard]] metadata::IndexStats index_stats() const;
  [[nodiscard]] common::Status save_index();
  [[nodiscard]] const metadata::MetadataIndex &index() const { return *index_; }

  [[nodiscard]] const std::filesystem::path &root() const { return validator_.root(); }
  [[nodiscard]] const storage::PathValidator &validator() const { return validator_; }
  [[nodiscard]] storage::FileOperationStats io_stats() const { return file_ops_->stats(); }

private:
  static constexpr std::size_t TYPE_COUNT = storage::FILE_TYPES.size();

  // Both yield true when the file had to be created from its template.
  [[nodiscard]] common::Result<bool> load_type(storage::FileType type);
  [[nodiscard]] common::Result<bool> create_from_template(storage::FileType type,
                                                          const std::filesystem::path &path);
  [[nodiscard]] common::Status write_through(const std::filesystem::path &path,
                                             const std::string &relative_path,
                                             const std::string &content,
                                             std::optional<storage::FileType> type);
  void record_file(storage::FileType type, const std::filesystem::path &path,
                   const std::string &content, std::optional<std::uint64_t> expected_generation);
  [[nodiscard]] std::optional<std::string> modified_at(const std::filesystem::path &path);
  [[nodiscard]] bool is_reserved(const std::string &relative_path) const;
  [[nodiscard]] common::Status rebuild_index_locked(const std::string &reason, bool persist);
  [[nodiscard]] common::Status save_index_locked();
  [[nodiscard]] common::Status open_index_store();
  void report(const common::Error &error, const std::string &component);

  MemoryBankOptions options_;
  std::shared_ptr<observability::IObserver> observer_;
  templates::TemplateProvider template_provider_;
  storage::PathValidator validator_;
  std::shared_ptr<storage::RetryingFileOperations> file_ops_;
  std::unique_ptr<storage::CacheManager> cache_;
  std::unique_ptr<storage::StreamingReader> streaming_;
  std::unique_ptr<metadata::MetadataIndex> index_;
  std::unique_ptr<metadata::IndexStore> index_store_;

  std::mutex write_mutex_;
  mutable std::mutex files_mutex_;
  std::array<std::optional<MemoryBankFile>, TYPE_COUNT> files_;
  std::array<std::uint64_t, TYPE_COUNT> generations_{};
  bool disposed_ = false;
};

} // namespace memorybank::core
