#pragma once

#include "memorybank/common/result.hpp"

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace memorybank::storage {

enum class FileType : std::size_t {
  ProjectBrief = 0,
  ProductContext,
  ActiveContext,
  ProgressCurrent,
  ProgressHistory,
  ProgressIndex,
  SystemPatternsIndex,
  SystemPatternsArchitecture,
  SystemPatternsPatterns,
  SystemPatternsScanning,
  TechContextIndex,
  TechContextStack,
  TechContextDependencies,
  TechContextEnvironment,
};

struct FileTypeInfo {
  FileType type;
  std::string_view id;
  std::string_view relative_path;
  // Front-matter "type" written into templates; selects the validation schema.
  std::string_view doc_type;
};

inline constexpr std::array<FileTypeInfo, 14> FILE_TYPES = {{
    {FileType::ProjectBrief, "projectBrief", "core/projectBrief.md", "projectBrief"},
    {FileType::ProductContext, "productContext", "core/productContext.md", "productContext"},
    {FileType::ActiveContext, "activeContext", "core/activeContext.md", "activeContext"},
    {FileType::ProgressCurrent, "progressCurrent", "progress/current.md", "progress"},
    {FileType::ProgressHistory, "progressHistory", "progress/history.md", "progress"},
    {FileType::ProgressIndex, "progressIndex", "progress/index.md", "progress"},
    {FileType::SystemPatternsIndex, "systemPatternsIndex", "systemPatterns/index.md",
     "systemPattern"},
    {FileType::SystemPatternsArchitecture, "systemPatternsArchitecture",
     "systemPatterns/architecture.md", "systemPattern"},
    {FileType::SystemPatternsPatterns, "systemPatternsPatterns", "systemPatterns/patterns.md",
     "systemPattern"},
    {FileType::SystemPatternsScanning, "systemPatternsScanning", "systemPatterns/scanning.md",
     "systemPattern"},
    {FileType::TechContextIndex, "techContextIndex", "techContext/index.md", "techContext"},
    {FileType::TechContextStack, "techContextStack", "techContext/stack.md", "techContext"},
    {FileType::TechContextDependencies, "techContextDependencies", "techContext/dependencies.md",
     "techContext"},
    {FileType::TechContextEnvironment, "techContextEnvironment", "techContext/environment.md",
     "techContext"},
}};

namespace detail {

constexpr bool file_table_is_ordered() {
  for (std::size_t i = 0; i < FILE_TYPES.size(); ++i) {
    if (static_cast<std::size_t>(FILE_TYPES[i].type) != i) {
      return false;
    }
  }
  return true;
}

} // namespace detail

static_assert(detail::file_table_is_ordered(), "FILE_TYPES must be indexed by FileType value");
static_assert(static_cast<std::size_t>(FileType::TechContextEnvironment) + 1 == FILE_TYPES.size(),
              "FILE_TYPES must cover every FileType");

[[nodiscard]] constexpr const FileTypeInfo &file_type_info(const FileType type) {
  return FILE_TYPES[static_cast<std::size_t>(type)];
}

[[nodiscard]] constexpr std::string_view to_string(const FileType type) {
  return file_type_info(type).id;
}

[[nodiscard]] constexpr std::string_view relative_path_of(const FileType type) {
  return file_type_info(type).relative_path;
}

[[nodiscard]] std::optional<FileType> file_type_from_string(std::string_view id);
[[nodiscard]] std::optional<FileType> file_type_from_path(std::string_view relative_path);

// Accepts either a type id ("projectBrief") or its relative path.
[[nodiscard]] common::Result<FileType> resolve_file_type(std::string_view id_or_path);

} // namespace memorybank::storage
