#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "bread/core/error.hpp"

namespace bread {

// Cancellation context handed to ingest() and to every processing callback.
// Cancellation is advisory: nothing is interrupted, holders poll done() or
// block in wait_for(). A child context is done when its parent is, and
// inherits the earlier of the two deadlines.
class Context {
 public:
  using Clock = std::chrono::steady_clock;

  static std::shared_ptr<Context> background();
  static std::shared_ptr<Context> with_cancel(const std::shared_ptr<Context>& parent);
  static std::shared_ptr<Context> with_deadline(const std::shared_ptr<Context>& parent,
                                                Clock::time_point deadline);
  static std::shared_ptr<Context> with_timeout(const std::shared_ptr<Context>& parent,
                                               std::chrono::nanoseconds timeout);

  Context(const Context&) = delete;
  Context& operator=(const Context&) = delete;

  void cancel() noexcept;

  bool done() const noexcept;
  std::optional<Error> err() const;
  std::optional<Clock::time_point> deadline() const noexcept { return deadline_; }

  // Returns true if the context is done by the time the wait ends.
  bool wait_for(std::chrono::nanoseconds timeout) const;

 private:
  explicit Context(std::optional<Clock::time_point> deadline);

  static std::shared_ptr<Context> make_child(const std::shared_ptr<Context>& parent,
                                             std::optional<Clock::time_point> deadline);

  void finish(ErrorCode reason) noexcept;
  bool expired_locked() const noexcept;

  const std::optional<Clock::time_point> deadline_;

  mutable std::mutex mu_;
  mutable std::condition_variable cv_;
  mutable std::optional<ErrorCode> reason_;
  std::vector<std::weak_ptr<Context>> children_;
};

}  // namespace bread
