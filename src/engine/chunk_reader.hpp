#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "bread/core/expected.hpp"
#include "bread/io/source.hpp"
#include "io/buffered_reader.hpp"

namespace bread::engine {

struct ChunkPolicy {
  size_t buffer_size{};
  std::byte delimiter{'\n'};
  bool no_delimiter{false};
};

// Assembles chunks from a source on the calling thread.
//
// A chunk starts as a fill of up to buffer_size bytes. Unless no_delimiter is
// set or the fill already ends on the delimiter, it is extended through the
// next delimiter or to the end of the source; with no delimiter left in the
// source the whole remainder becomes one chunk.
class ChunkReader {
 public:
  ChunkReader(IByteSource& source, ChunkPolicy policy);

  // Overwrites buffer with the next chunk. Returns false at end of source.
  Expected<bool> next(std::vector<std::byte>& buffer);

  uint64_t bytes_read() const noexcept { return reader_.consumed(); }

 private:
  io::BufferedReader reader_;
  ChunkPolicy policy_;
};

}  // namespace bread::engine
