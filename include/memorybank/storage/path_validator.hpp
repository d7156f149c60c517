#pragma once

#include "memorybank/common/result.hpp"
#include "memorybank/storage/file_types.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace memorybank::storage {

// Confines every path handed to the I/O layer to a single root directory. All
// checks are lexical; nothing here touches the filesystem.
class PathValidator {
public:
  explicit PathValidator(std::filesystem::path root);

  [[nodiscard]] const std::filesystem::path &root() const { return root_; }

  [[nodiscard]] common::Result<std::filesystem::path> resolve(FileType type) const;
  [[nodiscard]] common::Result<std::filesystem::path> resolve_known(std::string_view id_or_path) const;
  [[nodiscard]] common::Result<std::filesystem::path> resolve_relative(const std::string &relative) const;

  // For absolute paths produced elsewhere: fails with PathEscape when outside the root.
  [[nodiscard]] common::Result<std::filesystem::path>
  validate_absolute(const std::filesystem::path &path) const;

  [[nodiscard]] common::Result<std::string> relative_to_root(const std::filesystem::path &path) const;
  [[nodiscard]] bool contains(const std::filesystem::path &path) const;

private:
  std::filesystem::path root_;
};

} // namespace memorybank::storage
