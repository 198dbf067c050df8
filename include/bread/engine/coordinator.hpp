#pragma once

#include <condition_variable>
#include <cstdint>
#include <mutex>

#include "bread/core/context.hpp"
#include "bread/core/expected.hpp"
#include "bread/core/types.hpp"

namespace bread {

// Tracks launched units of work and produces the terminal result of one
// ingestion. The result is reported once; await() returns only after every
// launched unit has called finished().
class Coordinator {
 public:
  Coordinator() = default;

  Coordinator(const Coordinator&) = delete;
  Coordinator& operator=(const Coordinator&) = delete;

  void launched() noexcept;
  void finished() noexcept;

  // Failed if the read loop failed, else Cancelled if ctx is done by the
  // time draining completes, else Completed.
  Expected<void> await(const Context& ctx, Expected<void> loop_result) noexcept;

  IngestState state() const noexcept;
  uint64_t outstanding() const noexcept;

 private:
  mutable std::mutex mu_;
  std::condition_variable cv_done_;
  uint64_t outstanding_{0};
  IngestState state_{IngestState::Running};
  bool reported_{false};
};

}  // namespace bread
