#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace bread {

enum class IngestState { Running, Draining, Completed, Cancelled, Failed };

struct Chunk {
  std::span<std::byte> bytes{};
  uint64_t sequence{};
};

struct IngestStats {
  uint64_t chunks{};
  uint64_t bytes{};
  uint32_t peak_in_flight{};
  uint64_t buffers_allocated{};
  uint64_t callback_failures{};
  IngestState state{IngestState::Running};
};

struct AggregateMetrics {
  double mean{};
  double median{};
  double p95{};
  double min{};
  double max{};
};

const char* to_string(IngestState state) noexcept;

}  // namespace bread
