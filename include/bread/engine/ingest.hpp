#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

#include "bread/core/context.hpp"
#include "bread/core/expected.hpp"
#include "bread/core/types.hpp"
#include "bread/io/source.hpp"

namespace bread {

inline constexpr std::byte kDefaultDelimiter{'\n'};
inline constexpr uint32_t kDefaultWorkers = 1;

// Invoked once per chunk on a worker thread. chunk.bytes is valid only for
// the duration of the call. Failures are the callback's own business; an
// exception is contained and counted, never returned by ingest().
using ProcessFn = std::function<void(const Context&, Chunk&)>;

struct Config {
  // Required.
  ProcessFn process{};
  // Maximum concurrent process calls. 0 selects kDefaultWorkers.
  uint32_t workers{};
  // Buffers allocated before the first read.
  uint32_t buffer_seed{};
  // Required. Initial length of every buffer.
  uint32_t buffer_size{};
  // Unset selects kDefaultDelimiter.
  std::optional<std::byte> delimiter{};
  // Fixed-size chunks; the delimiter is ignored.
  bool no_delimiter{false};
};

// Checks required fields and applies defaults. Reads nothing.
Expected<Config> validate(const Config& cfg,
                          const std::shared_ptr<Context>& ctx,
                          const IByteSource* source) noexcept;

// Reads source to its end, handing each chunk to cfg.process with at most
// cfg.workers calls in flight. Returns once every launched call has returned.
//
// Cancellation is observed between chunks: once ctx is done no further call
// is launched, in-flight calls are awaited and ctx's error is returned. A
// source error is returned as-is after the same draining.
Expected<void> ingest(const Config& cfg,
                      const std::shared_ptr<Context>& ctx,
                      IByteSource* source,
                      IngestStats* stats = nullptr) noexcept;

}  // namespace bread
