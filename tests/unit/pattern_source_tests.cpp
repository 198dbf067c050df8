#include <array>
#include <cstddef>
#include <cstdint>
#include <format>
#include <iostream>
#include <vector>

#include "generator/pattern_source.hpp"

namespace {

bool test_layout() {
  const bread::app::PatternProfile profile{.total_bytes = 1000, .period = 300};
  const auto data = bread::app::make_pattern(profile);
  if (data.size() != 1000) {
    std::cerr << std::format("pattern size {} != 1000\n", data.size());
    return false;
  }
  for (size_t i = 0; i < data.size(); ++i) {
    const std::byte want = i % 300 == 0 ? profile.delimiter : profile.fill;
    if (data[i] != want) {
      std::cerr << std::format("byte {} is {:#x}\n", i, static_cast<unsigned>(data[i]));
      return false;
    }
  }
  return true;
}

bool test_streaming_matches_materialized() {
  const bread::app::PatternProfile profile{.total_bytes = 5000, .period = 37};
  const auto want = bread::app::make_pattern(profile);

  bread::app::PatternSource source(profile);
  std::vector<std::byte> got;
  std::array<std::byte, 113> buf{};
  for (;;) {
    auto n = source.read(buf);
    if (!n) {
      std::cerr << std::format("read failed: {}\n", n.error().what());
      return false;
    }
    if (*n == 0) {
      break;
    }
    got.insert(got.end(), buf.begin(), buf.begin() + static_cast<std::ptrdiff_t>(*n));
  }

  if (got != want) {
    std::cerr << std::format("streamed pattern differs from make_pattern\n");
    return false;
  }
  if (source.offset() != profile.total_bytes) {
    std::cerr << std::format("offset {} != {}\n", source.offset(), profile.total_bytes);
    return false;
  }

  auto again = source.read(buf);
  if (!again || *again != 0) {
    std::cerr << std::format("read past the end should return 0\n");
    return false;
  }
  return true;
}

}  // namespace

int main() {
  if (!test_layout()) {
    return 1;
  }
  if (!test_streaming_matches_materialized()) {
    return 1;
  }
  return 0;
}
