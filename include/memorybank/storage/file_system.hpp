#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace memorybank::storage {

struct FileStat {
  bool is_directory = false;
  std::uintmax_t size_bytes = 0;
  std::int64_t mtime_ns = 0;
};

// Receives successive pieces of a file. Returning false stops the read.
using ChunkSink = std::function<bool(std::string_view chunk)>;

// Raw I/O seam. Implementations report failures as errno-style error codes and
// never throw; RetryingFileOperations decides what is transient.
class IFileSystem {
public:
  virtual ~IFileSystem() = default;

  [[nodiscard]] virtual std::error_code read(const std::filesystem::path &path,
                                             std::string &out) = 0;
  // Feeds the file to `sink` in pieces of at most chunk_size bytes. A sink that
  // returns false ends the read with operation_canceled. The default slices a
  // whole-file read.
  [[nodiscard]] virtual std::error_code read_chunks(const std::filesystem::path &path,
                                                    std::size_t chunk_size, const ChunkSink &sink);
  // Either the whole content replaces the target or the target is left untouched.
  [[nodiscard]] virtual std::error_code write_atomic(const std::filesystem::path &path,
                                                     const std::string &content) = 0;
  [[nodiscard]] virtual std::error_code create_directories(const std::filesystem::path &path) = 0;
  [[nodiscard]] virtual std::error_code stat(const std::filesystem::path &path, FileStat &out) = 0;
  [[nodiscard]] virtual std::error_code remove(const std::filesystem::path &path) = 0;
  // Regular files below `dir`, recursively.
  [[nodiscard]] virtual std::error_code list_files(const std::filesystem::path &dir,
                                                   std::vector<std::filesystem::path> &out) = 0;
};

class NativeFileSystem final : public IFileSystem {
public:
  [[nodiscard]] std::error_code read(const std::filesystem::path &path, std::string &out) override;
  [[nodiscard]] std::error_code read_chunks(const std::filesystem::path &path,
                                            std::size_t chunk_size, const ChunkSink &sink) override;
  [[nodiscard]] std::error_code write_atomic(const std::filesystem::path &path,
                                             const std::string &content) override;
  [[nodiscard]] std::error_code create_directories(const std::filesystem::path &path) override;
  [[nodiscard]] std::error_code stat(const std::filesystem::path &path, FileStat &out) override;
  [[nodiscard]] std::error_code remove(const std::filesystem::path &path) override;
  [[nodiscard]] std::error_code list_files(const std::filesystem::path &dir,
                                           std::vector<std::filesystem::path> &out) override;
};

} // namespace memorybank::storage
