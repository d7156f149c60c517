#include "memorybank/storage/file_system.hpp"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace memorybank::storage {

namespace {

std::error_code last_errno() { return {errno, std::generic_category()}; }

std::filesystem::path temp_path_for(const std::filesystem::path &target) {
  static std::atomic<std::uint64_t> counter{0};
  const auto suffix = std::to_string(static_cast<long long>(::getpid())) + "." +
                      std::to_string(counter.fetch_add(1, std::memory_order_relaxed));
  return target.parent_path() / ("." + target.filename().string() + ".tmp." + suffix);
}

std::error_code write_all(const int fd, const std::string &content) {
  std::size_t written = 0;
  while (written < content.size()) {
    const auto n = ::write(fd, content.data() + written, content.size() - written);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return last_errno();
    }
    written += static_cast<std::size_t>(n);
  }
  return {};
}

} // namespace

std::error_code IFileSystem::read_chunks(const std::filesystem::path &path,
                                         const std::size_t chunk_size, const ChunkSink &sink) {
  std::string content;
  if (const auto ec = read(path, content)) {
    return ec;
  }
  const std::size_t step = std::max<std::size_t>(1, chunk_size);
  for (std::size_t offset = 0; offset < content.size(); offset += step) {
    if (!sink(std::string_view(content).substr(offset, step))) {
      return std::make_error_code(std::errc::operation_canceled);
    }
  }
  return {};
}

std::error_code NativeFileSystem::read_chunks(const std::filesystem::path &path,
                                              const std::size_t chunk_size, const ChunkSink &sink) {
  const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    return last_errno();
  }

  std::vector<char> buffer(std::max<std::size_t>(1, chunk_size));
  std::error_code ec;
  while (true) {
    const auto n = ::read(fd, buffer.data(), buffer.size());
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      ec = last_errno();
      break;
    }
    if (n == 0) {
      break;
    }
    if (!sink(std::string_view(buffer.data(), static_cast<std::size_t>(n)))) {
      ec = std::make_error_code(std::errc::operation_canceled);
      break;
    }
  }
  ::close(fd);
  return ec;
}

std::error_code NativeFileSystem::read(const std::filesystem::path &path, std::string &out) {
  const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    return last_errno();
  }

  std::string content;
  char buffer[8192];
  while (true) {
    const auto n = ::read(fd, buffer, sizeof(buffer));
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      const auto ec = last_errno();
      ::close(fd);
      return ec;
    }
    if (n == 0) {
      break;
    }
    content.append(buffer, static_cast<std::size_t>(n));
  }
  ::close(fd);
  out = std::move(content);
  return {};
}

std::error_code NativeFileSystem::write_atomic(const std::filesystem::path &path,
                                               const std::string &content) {
  const auto tmp = temp_path_for(path);
  const int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
  if (fd < 0) {
    return last_errno();
  }

  auto ec = write_all(fd, content);
  if (!ec && ::fsync(fd) != 0) {
    ec = last_errno();
  }
  if (::close(fd) != 0 && !ec) {
    ec = last_errno();
  }
  if (!ec && ::rename(tmp.c_str(), path.c_str()) != 0) {
    ec = last_errno();
  }
  if (ec) {
    ::unlink(tmp.c_str());
  }
  return ec;
}

std::error_code NativeFileSystem::create_directories(const std::filesystem::path &path) {
  std::error_code ec;
  if (std::filesystem::exists(path, ec)) {
    if (std::filesystem::is_directory(path, ec)) {
      return {};
    }
    return std::make_error_code(std::errc::file_exists);
  }
  std::filesystem::create_directories(path, ec);
  if (ec && std::filesystem::is_directory(path)) {
    // Lost a race with another creator.
    return {};
  }
  return ec;
}

std::error_code NativeFileSystem::stat(const std::filesystem::path &path, FileStat &out) {
  struct ::stat info {};
  if (::stat(path.c_str(), &info) != 0) {
    return last_errno();
  }
  out.is_directory = S_ISDIR(info.st_mode);
  out.size_bytes = static_cast<std::uintmax_t>(info.st_size);
  out.mtime_ns = static_cast<std::int64_t>(info.st_mtim.tv_sec) * 1'000'000'000LL +
                 static_cast<std::int64_t>(info.st_mtim.tv_nsec);
  return {};
}

std::error_code NativeFileSystem::remove(const std::filesystem::path &path) {
  if (::unlink(path.c_str()) != 0) {
    return last_errno();
  }
  return {};
}

std::error_code NativeFileSystem::list_files(const std::filesystem::path &dir,
                                             std::vector<std::filesystem::path> &out) {
  std::error_code ec;
  std::filesystem::recursive_directory_iterator it(
      dir, std::filesystem::directory_options::skip_permission_denied, ec);
  if (ec) {
    return ec;
  }
  std::vector<std::filesystem::path> files;
  for (const auto end = std::filesystem::recursive_directory_iterator(); it != end; it.increment(ec)) {
    if (ec) {
      return ec;
    }
    if (it->is_regular_file(ec)) {
      files.push_back(it->path());
    }
  }
  out = std::move(files);
  return {};
}

} // namespace memorybank::storage
