#include "memorybank/storage/path_validator.hpp"

#include "memorybank/common/fs.hpp"

namespace memorybank::storage {

namespace {

using PathResult = common::Result<std::filesystem::path>;

std::filesystem::path normalize_root(std::filesystem::path root) {
  if (root.empty()) {
    root = ".";
  }
  if (root.is_relative()) {
    std::error_code ec;
    auto absolute = std::filesystem::absolute(root, ec);
    if (!ec) {
      root = std::move(absolute);
    }
  }
  root = root.lexically_normal();
  if (root.filename().empty() && root.has_relative_path()) {
    root = root.parent_path();
  }
  return root;
}

common::Status check_relative_input(const std::string &relative) {
  if (relative.empty()) {
    return common::Status::error(common::ErrorCode::InvalidPath, "Path must not be empty");
  }
  if (relative.find('\0') != std::string::npos) {
    return common::Status::error(common::ErrorCode::InvalidPath, "Path contains null byte");
  }
  if (relative.find("..") != std::string::npos) {
    return common::Status::error(common::ErrorCode::InvalidPath,
                                 "Path must not contain '..': " + relative);
  }
  const std::filesystem::path as_path(relative);
  if (relative.front() == '/' || relative.front() == '\\' || as_path.is_absolute() ||
      as_path.has_root_name()) {
    return common::Status::error(common::ErrorCode::InvalidPath,
                                 "Path must be relative to the memory bank root: " + relative);
  }
  return common::Status::success();
}

} // namespace

PathValidator::PathValidator(std::filesystem::path root) : root_(normalize_root(std::move(root))) {}

bool PathValidator::contains(const std::filesystem::path &path) const {
  return common::is_subpath(path.lexically_normal(), root_);
}

PathResult PathValidator::resolve_relative(const std::string &relative) const {
  if (const auto status = check_relative_input(relative); !status.ok()) {
    return PathResult::failure(status.details());
  }

  const auto combined = (root_ / relative).lexically_normal();
  if (!common::is_subpath(combined, root_)) {
    return PathResult::failure(common::ErrorCode::PathEscape,
                               "Path escapes memory bank root: " + relative);
  }
  return PathResult::success(combined);
}

PathResult PathValidator::resolve(const FileType type) const {
  return resolve_relative(std::string(relative_path_of(type)));
}

PathResult PathValidator::resolve_known(const std::string_view id_or_path) const {
  const auto type = resolve_file_type(id_or_path);
  if (!type.ok()) {
    return PathResult::failure(type.details());
  }
  return resolve(type.value());
}

PathResult PathValidator::validate_absolute(const std::filesystem::path &path) const {
  const std::string raw = path.string();
  if (raw.empty() || raw.find('\0') != std::string::npos) {
    return PathResult::failure(common::ErrorCode::InvalidPath, "Invalid path");
  }
  const auto normalized = path.is_absolute() ? path.lexically_normal()
                                             : (root_ / path).lexically_normal();
  if (!common::is_subpath(normalized, root_)) {
    return PathResult::failure(common::ErrorCode::PathEscape,
                               "Path escapes memory bank root: " + raw);
  }
  return PathResult::success(normalized);
}

common::Result<std::string> PathValidator::relative_to_root(const std::filesystem::path &path) const {
  const auto validated = validate_absolute(path);
  if (!validated.ok()) {
    return common::Result<std::string>::failure(validated.details());
  }
  auto relative = validated.value().lexically_relative(root_).generic_string();
  if (relative.empty()) {
    relative = ".";
  }
  return common::Result<std::string>::success(std::move(relative));
}

} // namespace memorybank::storage
