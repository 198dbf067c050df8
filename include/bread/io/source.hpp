#pragma once

#include <cstddef>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include "bread/core/expected.hpp"

namespace bread {

// Sequential byte stream. Implementations need not be thread-safe; the engine
// reads from a single thread.
class IByteSource {
 public:
  virtual ~IByteSource() = default;

  // Reads up to out.size() bytes. A return of 0 marks the end of the source.
  virtual Expected<size_t> read(std::span<std::byte> out) noexcept = 0;
};

// Does not take ownership of fd.
Expected<std::unique_ptr<IByteSource>> make_fd_source(int fd) noexcept;
Expected<std::unique_ptr<IByteSource>> open_file_source(const std::string& path) noexcept;
std::unique_ptr<IByteSource> make_memory_source(std::vector<std::byte> data);

}  // namespace bread
