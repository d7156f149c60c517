#include "memorybank/core/memory_bank.hpp"

#include "memorybank/common/fs.hpp"
#include "memorybank/common/time.hpp"
#include "memorybank/config/config.hpp"
#include "memorybank/observability/noop_observer.hpp"

#include <chrono>
#include <set>

namespace memorybank::core {

namespace {

constexpr const char *HEALTHY_MESSAGE = "Memory bank is healthy. All files and folders are in place.";

std::size_t slot_of(const storage::FileType type) { return static_cast<std::size_t>(type); }

std::string rfc3339_from_nanos(const std::int64_t mtime_ns) {
  return common::format_rfc3339(static_cast<std::time_t>(mtime_ns / 1'000'000'000LL));
}

std::string join_issues(const std::vector<std::string> &issues) {
  std::string out;
  for (const auto &issue : issues) {
    out += "\n- " + issue;
  }
  return out;
}

} // namespace

common::Result<MemoryBankOptions> MemoryBankOptions::from_config(const config::Config &config) {
  const auto root = config::resolve_store_root(config);
  if (!root.ok()) {
    return common::Result<MemoryBankOptions>::failure(root.details());
  }
  MemoryBankOptions options;
  options.root = root.value();
  options.retry = storage::RetryPolicy::from_config(config.retry);
  options.cache = storage::CacheOptions::from_config(config.cache);
  options.index = config.index;
  options.streaming = storage::StreamingOptions::from_config(config.streaming);
  return common::Result<MemoryBankOptions>::success(std::move(options));
}

MemoryBank::MemoryBank(MemoryBankOptions options, MemoryBankDependencies deps)
    : options_(std::move(options)),
      observer_(observability::ensure_observer(std::move(deps.observer))),
      template_provider_(deps.template_provider ? std::move(deps.template_provider)
                                                : templates::default_provider()),
      validator_(options_.root),
      file_ops_(std::make_shared<storage::RetryingFileOperations>(std::move(deps.file_system),
                                                                  options_.retry, observer_)),
      cache_(std::make_unique<storage::CacheManager>(file_ops_, options_.cache, observer_)),
      streaming_(std::make_unique<storage::StreamingReader>(file_ops_, options_.streaming,
                                                            observer_)),
      index_(std::make_unique<metadata::MetadataIndex>(std::move(deps.schemas))) {}

MemoryBank::~MemoryBank() {
  const auto status = dispose();
  if (!status.ok()) {
    report(status.details(), "memory_bank");
  }
}

void MemoryBank::report(const common::Error &error, const std::string &component) {
  observer_->record_event(
      observability::ErrorEvent{.component = component, .message = error.describe()});
}

bool MemoryBank::is_reserved(const std::string &relative_path) const {
  const auto index_path = std::filesystem::path(options_.index.path).lexically_normal();
  const auto candidate = std::filesystem::path(relative_path).lexically_normal();
  if (index_path.empty() || candidate.empty()) {
    return false;
  }
  if (index_path.has_parent_path()) {
    return *candidate.begin() == *index_path.begin();
  }
  return candidate == index_path;
}

std::optional<std::string> MemoryBank::modified_at(const std::filesystem::path &path) {
  const auto info = file_ops_->stat(path);
  if (!info.ok()) {
    return std::nullopt;
  }
  return rfc3339_from_nanos(info.value().mtime_ns);
}

common::Status MemoryBank::open_index_store() {
  if (index_store_ == nullptr) {
    index_store_ = std::make_unique<metadata::IndexStore>(root() / options_.index.path);
  }
  return index_store_->open();
}

common::Status MemoryBank::init() {
  {
    std::lock_guard<std::mutex> lock(write_mutex_);
    disposed_ = false;
  }

  auto status = initialize_folders();
  if (!status.ok()) {
    return status;
  }
  if (!options_.index.enabled) {
    return common::Status::success();
  }

  std::lock_guard<std::mutex> lock(write_mutex_);
  bool store_open = false;
  std::string reason = "initial";
  if (options_.index.persist) {
    const auto opened = open_index_store();
    if (!opened.ok()) {
      report(opened.details(), "index_store");
    } else {
      store_open = true;
      const auto last_build = index_store_->last_build_time();
      if (!last_build.ok()) {
        report(last_build.details(), "index_store");
      } else if (last_build.value().has_value()) {
        const auto built_at = common::parse_rfc3339(*last_build.value());
        const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        const auto max_age = static_cast<std::time_t>(options_.index.max_age_hours) * 3600;
        if (built_at.has_value() && now - *built_at < max_age) {
          const auto started = std::chrono::steady_clock::now();
          auto entries = index_store_->load();
          if (entries.ok()) {
            const auto count = entries.value().size();
            index_->restore(std::move(entries.value()));
            observer_->record_event(observability::IndexRebuiltEvent{
                .entries = count,
                .duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - started),
                .reason = "restored"});
            return common::Status::success();
          }
          report(entries.details(), "index_store");
        }
        reason = "stale";
      }
    }
  }

  return rebuild_index_locked(reason, store_open);
}

common::Status MemoryBank::dispose() {
  std::lock_guard<std::mutex> lock(write_mutex_);
  if (disposed_) {
    return common::Status::success();
  }

  auto status = common::Status::success();
  if (options_.index.enabled && options_.index.persist && index_store_ != nullptr &&
      index_store_->is_open()) {
    status = save_index_locked();
  }

  cache_->invalidate();
  {
    std::lock_guard<std::mutex> files_lock(files_mutex_);
    for (std::size_t i = 0; i < TYPE_COUNT; ++i) {
      files_[i].reset();
      ++generations_[i];
    }
  }
  index_->clear();
  if (index_store_ != nullptr) {
    index_store_->close();
  }
  disposed_ = true;
  return status;
}

common::Status MemoryBank::initialize_folders() {
  auto status = file_ops_->mkdir(root());
  if (!status.ok()) {
    return status;
  }

  std::set<std::filesystem::path> parents;
  for (const auto &info : storage::FILE_TYPES) {
    const auto path = validator_.resolve(info.type);
    if (!path.ok()) {
      return path.status();
    }
    parents.insert(path.value().parent_path());
  }
  for (const auto &parent : parents) {
    status = file_ops_->mkdir(parent);
    if (!status.ok()) {
      return status;
    }
  }
  return common::Status::success();
}

void MemoryBank::record_file(const storage::FileType type, const std::filesystem::path &path,
                             const std::string &content,
                             const std::optional<std::uint64_t> expected_generation) {
  const auto mtime = modified_at(path);
  auto parsed = metadata::parse_document(content);
  const std::string relative(storage::relative_path_of(type));
  const std::size_t slot = slot_of(type);

  std::lock_guard<std::mutex> lock(files_mutex_);
  if (expected_generation.has_value() && generations_[slot] != *expected_generation) {
    // A write landed while this load was reading; its record is newer.
    return;
  }
  if (!expected_generation.has_value()) {
    ++generations_[slot];
  }

  auto status = metadata::ValidationStatus::Unknown;
  if (options_.index.enabled) {
    status = index_->upsert(relative, content, mtime).validation_status;
  } else if (!parsed.has_header || parsed.header_valid) {
    status = index_->schemas().validate(parsed.header).status;
  }

  files_[slot] = MemoryBankFile{.type = type,
                                .relative_path = relative,
                                .absolute_path = path,
                                .content = content,
                                .body = std::move(parsed.body),
                                .metadata = std::move(parsed.header),
                                .validation_status = status,
                                .last_updated = common::now_rfc3339()};
}

common::Status MemoryBank::write_through(const std::filesystem::path &path,
                                         const std::string &relative_path,
                                         const std::string &content,
                                         const std::optional<storage::FileType> type) {
  auto status = file_ops_->mkdir(path.parent_path());
  if (!status.ok()) {
    return status;
  }
  status = file_ops_->write(path, content);
  if (!status.ok()) {
    return status;
  }
  disposed_ = false;
  observer_->record_event(
      observability::FileWrittenEvent{.path = relative_path, .bytes = content.size()});

  if (const auto cached = cache_->put(path, content); !cached.ok()) {
    // The next get re-reads from disk.
    cache_->invalidate(path);
    report(cached.details(), "cache");
  }

  if (type.has_value()) {
    record_file(*type, path, content, std::nullopt);
  } else if (options_.index.enabled) {
    index_->upsert(relative_path, content, modified_at(path));
  }
  return common::Status::success();
}

common::Result<bool> MemoryBank::create_from_template(const storage::FileType type,
                                                      const std::filesystem::path &path) {
  std::lock_guard<std::mutex> lock(write_mutex_);

  const auto present = file_ops_->exists(path);
  if (!present.ok()) {
    return common::Result<bool>::failure(present.details());
  }
  if (present.value()) {
    // Another caller created it first.
    auto content = cache_->get(path);
    if (!content.ok()) {
      return common::Result<bool>::failure(content.details());
    }
    record_file(type, path, content.value(), std::nullopt);
    return common::Result<bool>::success(false);
  }

  std::string rendered;
  try {
    auto initial = templates::render_initial_content(type, template_provider_);
    if (!initial.ok()) {
      return common::Result<bool>::failure(initial.details());
    }
    rendered = std::move(initial.value());
  } catch (const std::exception &e) {
    return common::Result<bool>::failure(common::ErrorCode::Unknown,
                                         "Template provider failed for " +
                                             std::string(storage::to_string(type)),
                                         e.what());
  }

  const std::string relative(storage::relative_path_of(type));
  const auto status = write_through(path, relative, rendered, type);
  if (!status.ok()) {
    return common::Result<bool>::failure(status.details());
  }
  observer_->record_event(observability::FileCreatedEvent{
      .file_type = std::string(storage::to_string(type)), .path = relative});
  return common::Result<bool>::success(true);
}

common::Result<bool> MemoryBank::load_type(const storage::FileType type) {
  const auto path = validator_.resolve(type);
  if (!path.ok()) {
    return common::Result<bool>::failure(path.details());
  }

  std::uint64_t generation = 0;
  {
    std::lock_guard<std::mutex> lock(files_mutex_);
    generation = generations_[slot_of(type)];
  }

  auto content = cache_->get(path.value());
  if (!content.ok()) {
    if (content.code() == common::ErrorCode::NotFound) {
      return create_from_template(type, path.value());
    }
    return common::Result<bool>::failure(content.details());
  }

  record_file(type, path.value(), content.value(), generation);
  return common::Result<bool>::success(false);
}

common::Result<std::vector<storage::FileType>> MemoryBank::load_files() {
  using LoadResult = common::Result<std::vector<storage::FileType>>;
  const auto started = std::chrono::steady_clock::now();

  {
    std::lock_guard<std::mutex> lock(write_mutex_);
    disposed_ = false;
  }

  const auto folders = initialize_folders();
  if (!folders.ok()) {
    return LoadResult::failure(folders.details());
  }

  std::vector<storage::FileType> created;
  std::vector<std::pair<storage::FileType, common::Error>> failures;
  for (const auto &info : storage::FILE_TYPES) {
    const auto loaded = load_type(info.type);
    if (!loaded.ok()) {
      report(loaded.details(), "memory_bank");
      failures.emplace_back(info.type, loaded.details());
      continue;
    }
    if (loaded.value()) {
      created.push_back(info.type);
    }
  }

  if (options_.index.enabled && options_.index.persist) {
    if (const auto saved = save_index(); !saved.ok()) {
      report(saved.details(), "index_store");
    }
  }

  observer_->record_metric(observability::OperationLatencyMetric{
      .operation = "load_files",
      .latency = std::chrono::duration_cast<std::chrono::microseconds>(
          std::chrono::steady_clock::now() - started)});

  if (!failures.empty()) {
    std::string message = "Failed to load " + std::to_string(failures.size()) +
                          " memory bank file(s):";
    for (const auto &[type, error] : failures) {
      message += " " + std::string(storage::to_string(type)) + " (" + error.describe() + ");";
    }
    message.pop_back();
    return LoadResult::failure(failures.front().second.code, std::move(message),
                               failures.front().second.message);
  }
  return LoadResult::success(std::move(created));
}

std::optional<MemoryBankFile> MemoryBank::get_file(const storage::FileType type) const {
  std::lock_guard<std::mutex> lock(files_mutex_);
  return files_[slot_of(type)];
}

std::vector<MemoryBankFile> MemoryBank::get_all_files() const {
  std::lock_guard<std::mutex> lock(files_mutex_);
  std::vector<MemoryBankFile> out;
  for (const auto &file : files_) {
    if (file.has_value()) {
      out.push_back(*file);
    }
  }
  return out;
}

std::string MemoryBank::files_with_filenames() const {
  const auto files = get_all_files();
  if (files.empty()) {
    return "No files loaded in memory bank.";
  }
  std::string out = "Managed Files:";
  for (const auto &file : files) {
    out += "\n" + std::string(storage::to_string(file.type)) + ": " + file.absolute_path.string();
  }
  return out;
}

common::Result<std::vector<MemoryBankFileStats>> MemoryBank::file_stats() {
  std::vector<MemoryBankFileStats> out;
  for (const auto &info : storage::FILE_TYPES) {
    const auto path = validator_.resolve(info.type);
    if (!path.ok()) {
      return common::Result<std::vector<MemoryBankFileStats>>::failure(path.details());
    }
    const auto stat = file_ops_->stat(path.value());
    if (!stat.ok()) {
      continue;
    }
    const auto content = cache_->get(path.value());
    if (!content.ok()) {
      report(content.details(), "memory_bank");
      continue;
    }

    const auto parsed = metadata::parse_document(content.value());
    std::string created;
    if (const auto raw = parsed.header.get_string("created"); raw.has_value()) {
      created = common::normalize_timestamp(*raw).value_or(*raw);
    }
    out.push_back(MemoryBankFileStats{.type = info.type,
                                      .size_bytes = stat.value().size_bytes,
                                      .size = common::format_bytes(stat.value().size_bytes),
                                      .created = std::move(created),
                                      .updated = rfc3339_from_nanos(stat.value().mtime_ns)});
  }
  return common::Result<std::vector<MemoryBankFileStats>>::success(std::move(out));
}

common::Status MemoryBank::update_file(const storage::FileType type, const std::string &content) {
  const auto path = validator_.resolve(type);
  if (!path.ok()) {
    return path.status();
  }
  std::lock_guard<std::mutex> lock(write_mutex_);
  return write_through(path.value(), std::string(storage::relative_path_of(type)), content, type);
}

common::Status MemoryBank::write_file_by_path(const std::string &relative_path,
                                              const std::string &content) {
  const auto path = validator_.resolve_relative(relative_path);
  if (!path.ok()) {
    return path.status();
  }
  const auto relative = validator_.relative_to_root(path.value());
  if (!relative.ok()) {
    return relative.status();
  }
  if (relative.value() == "." || is_reserved(relative.value())) {
    return common::Status::error(common::ErrorCode::InvalidPath,
                                 "Path is reserved by the memory bank: " + relative_path);
  }

  const auto type = storage::file_type_from_path(relative.value());
  std::lock_guard<std::mutex> lock(write_mutex_);
  return write_through(path.value(), relative.value(), content, type);
}

common::Result<std::string> MemoryBank::read_file_by_path(const std::string &relative_path) {
  const auto path = validator_.resolve_relative(relative_path);
  if (!path.ok()) {
    return common::Result<std::string>::failure(path.details());
  }
  return cache_->get(path.value());
}

common::Result<storage::StreamingResult>
MemoryBank::stream_file_by_path(const std::string &relative_path,
                                const storage::StreamingProgress &progress) {
  const auto path = validator_.resolve_relative(relative_path);
  if (!path.ok()) {
    return common::Result<storage::StreamingResult>::failure(path.details());
  }
  return streaming_->read(path.value(), progress);
}

storage::StreamingStats MemoryBank::streaming_stats() const { return streaming_->stats(); }

HealthReport MemoryBank::diagnose() {
  HealthReport report;

  const auto root_stat = file_ops_->stat(root());
  if (!root_stat.ok()) {
    report.issues.push_back("Root memory-bank folder not found at: " + root().string());
  } else if (!root_stat.value().is_directory) {
    report.issues.push_back("Path is not a directory: " + root().string());
  }

  for (const auto &info : storage::FILE_TYPES) {
    const std::string id(info.id);
    const auto path = validator_.resolve(info.type);
    if (!path.ok()) {
      report.issues.push_back("Invalid path for " + id + ": " + path.error());
      continue;
    }

    const auto dir = path.value().parent_path();
    const auto dir_stat = file_ops_->stat(dir);
    if (!dir_stat.ok()) {
      report.issues.push_back("Directory not found for " + id + ": " + dir.string());
    } else if (!dir_stat.value().is_directory) {
      report.issues.push_back("Path is not a directory for " + id + ": " + dir.string());
    }

    const auto content = file_ops_->read(path.value());
    if (!content.ok()) {
      if (content.code() == common::ErrorCode::NotFound) {
        report.issues.push_back("File not found: " + id);
      } else {
        report.issues.push_back("File not readable: " + id + " (" + content.details().describe() +
                                ")");
      }
    }
  }

  report.healthy = report.issues.empty();
  report.summary = report.healthy ? "Memory bank is healthy."
                                  : "Found " + std::to_string(report.issues.size()) + " issues.";
  observer_->record_event(
      observability::HealthCheckEvent{.healthy = report.healthy, .issues = report.issues.size()});
  return report;
}

common::Result<std::string> MemoryBank::check_health() {
  const auto report = diagnose();
  if (report.healthy) {
    return common::Result<std::string>::success(HEALTHY_MESSAGE);
  }
  return common::Result<std::string>::failure(
      common::ErrorCode::HealthCheckFailed,
      "Health check completed.\n\nIssues found:" + join_issues(report.issues), report.summary);
}

common::Status MemoryBank::invalidate_cache(const std::optional<std::string> &relative_path) {
  if (!relative_path.has_value()) {
    cache_->invalidate();
    return common::Status::success();
  }

  const auto path = storage::file_type_from_string(*relative_path).has_value()
                        ? validator_.resolve_known(*relative_path)
                        : validator_.resolve_relative(*relative_path);
  if (!path.ok()) {
    return path.status();
  }
  cache_->invalidate(path.value());
  return common::Status::success();
}

storage::CacheStats MemoryBank::cache_stats() const { return cache_->stats(); }

void MemoryBank::reset_cache_stats() { cache_->reset_stats(); }

storage::CacheUsage MemoryBank::cache_usage() const { return cache_->usage(); }

metadata::QueryResult MemoryBank::search(const metadata::IndexFilter &filter) const {
  return index_->query(filter);
}

metadata::IndexStats MemoryBank::index_stats() const { return index_->stats(); }

common::Status MemoryBank::rebuild_index() {
  std::lock_guard<std::mutex> lock(write_mutex_);
  return rebuild_index_locked("manual", options_.index.persist);
}

common::Status MemoryBank::rebuild_index_locked(const std::string &reason, const bool persist) {
  if (!options_.index.enabled) {
    return common::Status::success();
  }
  const auto started = std::chrono::steady_clock::now();

  const auto files = file_ops_->list_files(root());
  if (!files.ok()) {
    return files.status();
  }

  std::vector<metadata::IndexSource> sources;
  for (const auto &file : files.value()) {
    const auto relative = validator_.relative_to_root(file);
    if (!relative.ok() || is_reserved(relative.value())) {
      continue;
    }
    const auto name = file.filename().string();
    if (file.extension() != ".md" || common::starts_with(name, ".")) {
      continue;
    }
    auto content = file_ops_->read(file);
    if (!content.ok()) {
      report(content.details(), "index");
      continue;
    }
    sources.push_back(metadata::IndexSource{.relative_path = relative.value(),
                                            .content = std::move(content.value()),
                                            .modified_at = modified_at(file)});
  }

  index_->rebuild_all(sources);
  observer_->record_event(observability::IndexRebuiltEvent{
      .entries = sources.size(),
      .duration = std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - started),
      .reason = reason});

  if (persist) {
    return save_index_locked();
  }
  return common::Status::success();
}

common::Status MemoryBank::save_index() {
  std::lock_guard<std::mutex> lock(write_mutex_);
  return save_index_locked();
}

common::Status MemoryBank::save_index_locked() {
  if (!options_.index.enabled || !options_.index.persist) {
    return common::Status::success();
  }
  const auto opened = open_index_store();
  if (!opened.ok()) {
    return opened;
  }
  return index_store_->save(index_->snapshot());
}

} // namespace memorybank::core
