#include "bread/io/source.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <exception>
#include <format>
#include <string>
#include <utility>

#include <fcntl.h>
#include <unistd.h>

#include "bread/core/error.hpp"

namespace bread {
namespace {

Expected<size_t> read_fd(int fd, std::span<std::byte> out) noexcept {
  for (;;) {
    const ssize_t n = ::read(fd, out.data(), out.size());
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return unexpected(Error{ErrorCode::IoError, std::strerror(errno)});
    }
    return static_cast<size_t>(n);
  }
}

class FdSource final : public IByteSource {
 public:
  explicit FdSource(int fd) : fd_(fd) {}

  Expected<size_t> read(std::span<std::byte> out) noexcept override {
    if (out.empty()) {
      return size_t{0};
    }
    return read_fd(fd_, out);
  }

 private:
  int fd_{-1};
};

class FileSource final : public IByteSource {
 public:
  explicit FileSource(int fd) : fd_(fd) {}

  ~FileSource() override {
    if (fd_ >= 0) {
      ::close(fd_);
    }
  }

  FileSource(const FileSource&) = delete;
  FileSource& operator=(const FileSource&) = delete;

  Expected<size_t> read(std::span<std::byte> out) noexcept override {
    if (out.empty()) {
      return size_t{0};
    }
    return read_fd(fd_, out);
  }

 private:
  int fd_{-1};
};

class MemorySource final : public IByteSource {
 public:
  explicit MemorySource(std::vector<std::byte> data) : data_(std::move(data)) {}

  Expected<size_t> read(std::span<std::byte> out) noexcept override {
    const size_t n = std::min(out.size(), data_.size() - offset_);
    std::copy_n(data_.begin() + static_cast<std::ptrdiff_t>(offset_), n, out.begin());
    offset_ += n;
    return n;
  }

 private:
  std::vector<std::byte> data_;
  size_t offset_{0};
};

}  // namespace

Expected<std::unique_ptr<IByteSource>> make_fd_source(int fd) noexcept {
  if (fd < 0) {
    return unexpected(Error{ErrorCode::InvalidArgument, "invalid file descriptor"});
  }
  try {
    return std::unique_ptr<IByteSource>(new FdSource(fd));
  } catch (const std::exception& ex) {
    return unexpected(Error{ErrorCode::Internal, ex.what()});
  }
}

Expected<std::unique_ptr<IByteSource>> open_file_source(const std::string& path) noexcept {
  int fd = -1;
  do {
    fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  } while (fd < 0 && errno == EINTR);
  if (fd < 0) {
    const int saved = errno;
    try {
      return unexpected(Error{ErrorCode::IoError,
                              std::format("open {} failed: {}", path, std::strerror(saved))});
    } catch (const std::exception&) {
      return unexpected(Error{ErrorCode::IoError, std::strerror(saved)});
    }
  }

#ifdef POSIX_FADV_SEQUENTIAL
  static_cast<void>(::posix_fadvise(fd, 0, 0, POSIX_FADV_SEQUENTIAL));
#endif

  try {
    return std::unique_ptr<IByteSource>(new FileSource(fd));
  } catch (const std::exception& ex) {
    ::close(fd);
    return unexpected(Error{ErrorCode::Internal, ex.what()});
  }
}

std::unique_ptr<IByteSource> make_memory_source(std::vector<std::byte> data) {
  return std::make_unique<MemorySource>(std::move(data));
}

}  // namespace bread
