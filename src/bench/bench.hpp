#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

#include "bread/core/expected.hpp"
#include "bread/core/types.hpp"
#include "bread/core/units.hpp"

namespace bread {

struct BenchConfig {
  uint32_t workers{16};
  uint32_t buffer_seed{0};
  uint32_t buffer_size{static_cast<uint32_t>(MB)};
  uint64_t source_bytes{GB};
  uint32_t record_period{300};
  std::byte delimiter{'X'};
};

struct BenchResult {
  double wall_sec{};
  double eff_gbps{};
  IngestStats stats{};
};

// Ingests a generated record stream with a no-op processing callback.
Expected<BenchResult> run_ingest_bench(const BenchConfig& cfg) noexcept;

AggregateMetrics summarize_repeats(std::span<const BenchResult> repeats) noexcept;

}  // namespace bread
