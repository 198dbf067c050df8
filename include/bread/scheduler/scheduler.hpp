#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>

#include "bread/core/expected.hpp"

namespace bread {

using Task = std::move_only_function<void()>;

struct SchedulerConfig {
  uint32_t worker_threads{};
  uint32_t queue_depth{};
};

class IScheduler {
 public:
  virtual ~IScheduler() = default;

  virtual Expected<void> start() noexcept = 0;
  // Blocks while the queue is full.
  virtual Expected<void> submit(Task task) noexcept = 0;
  virtual Expected<void> stop_issue_new_work() noexcept = 0;
  // Runs every queued task, then stops the workers.
  virtual Expected<void> join() noexcept = 0;

  virtual uint64_t processed() const noexcept = 0;
  // Tasks that exited by an exception.
  virtual uint64_t failed() const noexcept = 0;
};

Expected<std::unique_ptr<IScheduler>> make_scheduler(const SchedulerConfig&) noexcept;

}  // namespace bread
