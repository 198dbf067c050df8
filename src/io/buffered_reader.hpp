#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "bread/core/expected.hpp"
#include "bread/io/source.hpp"

namespace bread::io {

// Read-ahead wrapper over an IByteSource. End of source and source errors
// are sticky: once seen, every later call reports the same outcome.
class BufferedReader {
 public:
  static constexpr size_t kDefaultReadAhead = 4096;

  explicit BufferedReader(IByteSource& source, size_t read_ahead = kDefaultReadAhead);

  // Reads until out is full or the source ends. Returns the byte count;
  // 0 only at end of source.
  Expected<size_t> read_full(std::span<std::byte> out);

  // Appends bytes through the next delim (inclusive) to out. Returns false
  // when the source ended before a delimiter was found.
  Expected<bool> read_until(std::byte delim, std::vector<std::byte>& out);

  uint64_t consumed() const noexcept { return consumed_; }

 private:
  Expected<void> fill();
  size_t buffered() const noexcept { return end_ - begin_; }

  IByteSource& source_;
  std::vector<std::byte> buf_;
  size_t begin_{0};
  size_t end_{0};
  uint64_t consumed_{0};
  bool eof_{false};
  std::optional<Error> error_;
};

}  // namespace bread::io
