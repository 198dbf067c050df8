#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>

#include "bread/core/types.hpp"

namespace bread::app {

struct SinkTotals {
  uint64_t chunks{0};
  uint64_t bytes{0};
  uint64_t records{0};
  uint64_t largest_chunk{0};
  uint64_t digest{0};
};

// Terminal stage for chunks completing on many threads. Each chunk is hashed
// together with its sequence number and the lanes are folded with commutative
// operations, so the digest depends on where a chunk sat in the stream but not
// on which worker finished first.
class HashSink {
 public:
  // Records are counted only when record_delimiter is set.
  explicit HashSink(uint64_t seed, std::optional<std::byte> record_delimiter = std::nullopt);

  HashSink(const HashSink&) = delete;
  HashSink& operator=(const HashSink&) = delete;

  void consume(const Chunk& chunk);

  SinkTotals totals() const;

 private:
  const uint64_t seed_;
  const std::optional<std::byte> record_delimiter_;

  std::atomic<uint64_t> chunks_{0};
  std::atomic<uint64_t> bytes_{0};
  std::atomic<uint64_t> records_{0};
  std::atomic<uint64_t> largest_{0};
  std::atomic<uint64_t> xor_lane_{0};
  std::atomic<uint64_t> sum_lane_{0};
};

}  // namespace bread::app
