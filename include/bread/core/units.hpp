#pragma once

#include <cstdint>

namespace bread {

// Byte-size helpers for callers sizing buffers. Not used by the engine.
inline constexpr uint64_t KB = 1024;
inline constexpr uint64_t MB = 1024 * KB;
inline constexpr uint64_t GB = 1024 * MB;

}  // namespace bread
