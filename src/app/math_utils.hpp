#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

#include "bread/core/expected.hpp"
#include "bread/core/types.hpp"

namespace bread::app {

AggregateMetrics calc_stats(std::vector<double> values);
double to_gbps(uint64_t bytes, double sec);

// Accepts a plain byte count or a count with a K/M/G suffix (optionally
// followed by "iB" or "B"); suffixes are 1024-based.
Expected<uint64_t> parse_size(std::string_view text) noexcept;

}  // namespace bread::app
