#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "bread/core/expected.hpp"
#include "bread/io/source.hpp"

namespace bread::app {

struct PatternProfile {
  uint64_t total_bytes{};
  uint32_t period{300};
  std::byte fill{'O'};
  std::byte delimiter{'X'};
};

// Synthetic record stream generated on demand: every byte at an offset
// divisible by period is the delimiter, every other byte is fill.
class PatternSource final : public IByteSource {
 public:
  explicit PatternSource(PatternProfile profile);

  Expected<size_t> read(std::span<std::byte> out) noexcept override;

  uint64_t offset() const noexcept { return offset_; }

 private:
  PatternProfile profile_;
  uint64_t offset_{0};
};

// Materialized copy of the stream a PatternSource with the same profile yields.
std::vector<std::byte> make_pattern(const PatternProfile& profile);

}  // namespace bread::app
