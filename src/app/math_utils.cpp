#include "app/math_utils.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <limits>
#include <numeric>

#include "bread/core/error.hpp"
#include "bread/core/units.hpp"

namespace bread::app {

AggregateMetrics calc_stats(std::vector<double> values) {
  AggregateMetrics out{};
  if (values.empty()) {
    return out;
  }
  std::sort(values.begin(), values.end());
  out.min = values.front();
  out.max = values.back();
  const double sum = std::accumulate(values.begin(), values.end(), 0.0);
  out.mean = sum / static_cast<double>(values.size());

  const auto percentile = [&](double p) {
    const double idx = p * static_cast<double>(values.size() - 1);
    const auto lo = static_cast<size_t>(std::floor(idx));
    const auto hi = static_cast<size_t>(std::ceil(idx));
    if (lo == hi) {
      return values[lo];
    }
    const double frac = idx - static_cast<double>(lo);
    return values[lo] * (1.0 - frac) + values[hi] * frac;
  };

  out.median = percentile(0.50);
  out.p95 = percentile(0.95);
  return out;
}

double to_gbps(uint64_t bytes, double sec) {
  if (sec <= 0.0) {
    return 0.0;
  }
  return static_cast<double>(bytes) / sec / 1e9;
}

Expected<uint64_t> parse_size(std::string_view text) noexcept {
  uint64_t value = 0;
  const auto* first = text.data();
  const auto* last = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc{} || ptr == first) {
    return unexpected(Error{ErrorCode::InvalidArgument, "size must start with a number"});
  }

  std::string_view suffix(ptr, static_cast<size_t>(last - ptr));
  uint64_t unit = 1;
  if (!suffix.empty()) {
    switch (std::toupper(static_cast<unsigned char>(suffix.front()))) {
      case 'K':
        unit = KB;
        break;
      case 'M':
        unit = MB;
        break;
      case 'G':
        unit = GB;
        break;
      default:
        return unexpected(Error{ErrorCode::InvalidArgument, "unknown size suffix"});
    }
    suffix.remove_prefix(1);
    if (!suffix.empty() && suffix != "B" && suffix != "iB") {
      return unexpected(Error{ErrorCode::InvalidArgument, "unknown size suffix"});
    }
  }

  if (value > std::numeric_limits<uint64_t>::max() / unit) {
    return unexpected(Error{ErrorCode::InvalidArgument, "size overflows"});
  }
  return value * unit;
}

}  // namespace bread::app
