#include "sink/hash_sink.hpp"

#include <algorithm>
#include <array>

#include <xxhash.h>

namespace bread::app {
namespace {

constexpr uint64_t kGolden = 0x9e3779b97f4a7c15ULL;

}  // namespace

HashSink::HashSink(uint64_t seed, std::optional<std::byte> record_delimiter)
    : seed_(seed), record_delimiter_(record_delimiter) {}

void HashSink::consume(const Chunk& chunk) {
  const auto size = static_cast<uint64_t>(chunk.bytes.size());
  const uint64_t h = XXH3_64bits_withSeed(chunk.bytes.data(), chunk.bytes.size(),
                                          seed_ ^ (chunk.sequence * kGolden));

  if (record_delimiter_) {
    const auto n = std::count(chunk.bytes.begin(), chunk.bytes.end(), *record_delimiter_);
    records_.fetch_add(static_cast<uint64_t>(n), std::memory_order_relaxed);
  }

  uint64_t prev = largest_.load(std::memory_order_relaxed);
  while (size > prev && !largest_.compare_exchange_weak(prev, size, std::memory_order_relaxed)) {
  }

  chunks_.fetch_add(1, std::memory_order_relaxed);
  bytes_.fetch_add(size, std::memory_order_relaxed);
  xor_lane_.fetch_xor(h, std::memory_order_relaxed);
  sum_lane_.fetch_add(h * kGolden + size, std::memory_order_relaxed);
}

SinkTotals HashSink::totals() const {
  SinkTotals out{};
  out.chunks = chunks_.load(std::memory_order_relaxed);
  out.bytes = bytes_.load(std::memory_order_relaxed);
  out.records = records_.load(std::memory_order_relaxed);
  out.largest_chunk = largest_.load(std::memory_order_relaxed);

  const std::array<uint64_t, 4> lanes{out.chunks, out.bytes,
                                      xor_lane_.load(std::memory_order_relaxed),
                                      sum_lane_.load(std::memory_order_relaxed)};
  out.digest = XXH64(lanes.data(), sizeof(lanes), seed_);
  return out;
}

}  // namespace bread::app
