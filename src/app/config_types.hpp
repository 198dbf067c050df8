#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "bread/codec/codec.hpp"
#include "bread/core/units.hpp"

namespace bread::app {

struct Config {
  std::string input{"-"};

  uint32_t workers{1};
  uint32_t buffer_seed{0};
  uint32_t buffer_size{static_cast<uint32_t>(MB)};
  std::byte delimiter{'\n'};
  bool no_delimiter{false};

  CodecId codec{CodecId::None};
  int codec_level{1};
  // Decompress every compressed chunk and compare it with the original.
  bool verify{false};

  uint64_t seed{1};
  uint64_t timeout_ms{0};
  bool quiet{false};
};

struct RunSummary {
  uint64_t chunks{0};
  uint64_t bytes{0};
  uint64_t records{0};
  uint64_t largest_chunk{0};
  uint64_t compressed_bytes{0};
  uint64_t verified_chunks{0};
  uint64_t digest{0};
  uint32_t peak_in_flight{0};
  uint64_t buffers_allocated{0};
  uint64_t callback_failures{0};
  double wall_sec{0.0};
};

}  // namespace bread::app
