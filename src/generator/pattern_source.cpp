#include "generator/pattern_source.hpp"

#include <algorithm>

namespace bread::app {
namespace {

void generate(const PatternProfile& profile, uint64_t offset, std::span<std::byte> out) {
  const uint64_t period = std::max<uint64_t>(1, profile.period);
  uint64_t phase = offset % period;
  for (auto& b : out) {
    b = phase == 0 ? profile.delimiter : profile.fill;
    if (++phase == period) {
      phase = 0;
    }
  }
}

}  // namespace

PatternSource::PatternSource(PatternProfile profile) : profile_(profile) {}

Expected<size_t> PatternSource::read(std::span<std::byte> out) noexcept {
  const uint64_t left = profile_.total_bytes - offset_;
  const auto n = static_cast<size_t>(std::min<uint64_t>(left, out.size()));
  generate(profile_, offset_, out.first(n));
  offset_ += n;
  return n;
}

std::vector<std::byte> make_pattern(const PatternProfile& profile) {
  std::vector<std::byte> out(static_cast<size_t>(profile.total_bytes));
  generate(profile, 0, out);
  return out;
}

}  // namespace bread::app
