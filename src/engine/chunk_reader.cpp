#include "engine/chunk_reader.hpp"

namespace bread::engine {

ChunkReader::ChunkReader(IByteSource& source, ChunkPolicy policy)
    : reader_(source), policy_(policy) {}

Expected<bool> ChunkReader::next(std::vector<std::byte>& buffer) {
  buffer.resize(policy_.buffer_size);
  auto n = reader_.read_full(buffer);
  if (!n) {
    return unexpected(n.error());
  }
  buffer.resize(*n);
  if (*n == 0) {
    return false;
  }

  if (policy_.no_delimiter || buffer.back() == policy_.delimiter) {
    return true;
  }

  auto found = reader_.read_until(policy_.delimiter, buffer);
  if (!found) {
    return unexpected(found.error());
  }
  return true;
}

}  // namespace bread::engine
