#include "bread/engine/coordinator.hpp"

#include <exception>
#include <utility>

#include "bread/core/error.hpp"

namespace bread {

const char* to_string(IngestState state) noexcept {
  switch (state) {
    case IngestState::Running:
      return "running";
    case IngestState::Draining:
      return "draining";
    case IngestState::Completed:
      return "completed";
    case IngestState::Cancelled:
      return "cancelled";
    case IngestState::Failed:
      return "failed";
  }
  return "unknown";
}

void Coordinator::launched() noexcept {
  std::scoped_lock lock(mu_);
  ++outstanding_;
}

void Coordinator::finished() noexcept {
  std::scoped_lock lock(mu_);
  if (outstanding_ > 0) {
    --outstanding_;
  }
  if (outstanding_ == 0) {
    cv_done_.notify_all();
  }
}

Expected<void> Coordinator::await(const Context& ctx, Expected<void> loop_result) noexcept {
  std::unique_lock lock(mu_);
  if (reported_) {
    return unexpected(Error{ErrorCode::Internal, "result already reported"});
  }
  reported_ = true;
  state_ = IngestState::Draining;
  cv_done_.wait(lock, [this]() { return outstanding_ == 0; });

  if (!loop_result) {
    state_ = IngestState::Failed;
    return loop_result;
  }

  try {
    if (auto err = ctx.err()) {
      state_ = IngestState::Cancelled;
      return unexpected(std::move(*err));
    }
  } catch (const std::exception& ex) {
    state_ = IngestState::Failed;
    return unexpected(Error{ErrorCode::Internal, ex.what()});
  }

  state_ = IngestState::Completed;
  return {};
}

IngestState Coordinator::state() const noexcept {
  std::scoped_lock lock(mu_);
  return state_;
}

uint64_t Coordinator::outstanding() const noexcept {
  std::scoped_lock lock(mu_);
  return outstanding_;
}

}  // namespace bread
