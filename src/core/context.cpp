#include "bread/core/context.hpp"

#include <algorithm>
#include <utility>

namespace bread {
namespace {

// now + timeout, saturating at the clock's largest time point.
Context::Clock::time_point deadline_after(std::chrono::nanoseconds timeout) {
  const auto now = Context::Clock::now();
  if (timeout <= std::chrono::nanoseconds::zero()) {
    return now;
  }
  const auto room = Context::Clock::time_point::max() - now;
  if (timeout >= std::chrono::duration_cast<std::chrono::nanoseconds>(room)) {
    return Context::Clock::time_point::max();
  }
  return now + std::chrono::duration_cast<Context::Clock::duration>(timeout);
}

}  // namespace

Context::Context(std::optional<Clock::time_point> deadline) : deadline_(deadline) {}

std::shared_ptr<Context> Context::background() {
  return std::shared_ptr<Context>(new Context(std::nullopt));
}

std::shared_ptr<Context> Context::with_cancel(const std::shared_ptr<Context>& parent) {
  return make_child(parent, std::nullopt);
}

std::shared_ptr<Context> Context::with_deadline(const std::shared_ptr<Context>& parent,
                                                Clock::time_point deadline) {
  return make_child(parent, deadline);
}

std::shared_ptr<Context> Context::with_timeout(const std::shared_ptr<Context>& parent,
                                               std::chrono::nanoseconds timeout) {
  return make_child(parent, deadline_after(timeout));
}

std::shared_ptr<Context> Context::make_child(const std::shared_ptr<Context>& parent,
                                             std::optional<Clock::time_point> deadline) {
  if (parent && parent->deadline_ && (!deadline || *parent->deadline_ < *deadline)) {
    deadline = parent->deadline_;
  }

  std::shared_ptr<Context> child(new Context(deadline));
  if (!parent) {
    return child;
  }

  std::optional<ErrorCode> inherited;
  {
    std::scoped_lock lock(parent->mu_);
    if (parent->expired_locked()) {
      inherited = parent->reason_;
    } else {
      std::erase_if(parent->children_, [](const std::weak_ptr<Context>& w) { return w.expired(); });
      parent->children_.push_back(child);
    }
  }
  if (inherited) {
    child->finish(*inherited);
  }
  return child;
}

void Context::cancel() noexcept { finish(ErrorCode::Cancelled); }

void Context::finish(ErrorCode reason) noexcept {
  std::vector<std::weak_ptr<Context>> children;
  {
    std::scoped_lock lock(mu_);
    if (reason_) {
      return;
    }
    reason_ = reason;
    children.swap(children_);
  }
  cv_.notify_all();

  for (auto& weak : children) {
    if (auto child = weak.lock()) {
      child->finish(reason);
    }
  }
}

// Deadlines are detected lazily; children carry the inherited deadline and
// detect it on their own.
bool Context::expired_locked() const noexcept {
  if (!reason_ && deadline_ && Clock::now() >= *deadline_) {
    reason_ = ErrorCode::DeadlineExceeded;
  }
  return reason_.has_value();
}

bool Context::done() const noexcept {
  std::scoped_lock lock(mu_);
  return expired_locked();
}

std::optional<Error> Context::err() const {
  std::scoped_lock lock(mu_);
  if (!expired_locked()) {
    return std::nullopt;
  }
  if (*reason_ == ErrorCode::DeadlineExceeded) {
    return Error{ErrorCode::DeadlineExceeded, "context deadline exceeded"};
  }
  return Error{*reason_, "context canceled"};
}

bool Context::wait_for(std::chrono::nanoseconds timeout) const {
  std::unique_lock lock(mu_);
  Clock::time_point until = deadline_after(timeout);
  if (deadline_) {
    until = std::min(until, *deadline_);
  }
  cv_.wait_until(lock, until, [this]() { return reason_.has_value(); });
  return expired_locked();
}

}  // namespace bread
