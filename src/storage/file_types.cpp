#include "memorybank/storage/file_types.hpp"

#include <filesystem>

namespace memorybank::storage {

std::optional<FileType> file_type_from_string(const std::string_view id) {
  for (const auto &info : FILE_TYPES) {
    if (info.id == id) {
      return info.type;
    }
  }
  return std::nullopt;
}

std::optional<FileType> file_type_from_path(const std::string_view relative_path) {
  const std::string normalized =
      std::filesystem::path(std::string(relative_path)).lexically_normal().generic_string();
  for (const auto &info : FILE_TYPES) {
    if (info.relative_path == normalized) {
      return info.type;
    }
  }
  return std::nullopt;
}

common::Result<FileType> resolve_file_type(const std::string_view id_or_path) {
  if (const auto by_id = file_type_from_string(id_or_path); by_id.has_value()) {
    return common::Result<FileType>::success(*by_id);
  }
  if (const auto by_path = file_type_from_path(id_or_path); by_path.has_value()) {
    return common::Result<FileType>::success(*by_path);
  }
  return common::Result<FileType>::failure(common::ErrorCode::UnknownFileType,
                                           "Unknown memory bank file type: " +
                                               std::string(id_or_path));
}

} // namespace memorybank::storage
