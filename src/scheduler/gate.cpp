#include "bread/scheduler/gate.hpp"

#include <algorithm>

namespace bread {

Gate::Gate(uint32_t capacity) : capacity_(std::max(1u, capacity)) {}

void Gate::acquire() {
  std::unique_lock lock(mu_);
  cv_.wait(lock, [this]() { return in_flight_ < capacity_; });
  ++in_flight_;
  peak_ = std::max(peak_, in_flight_);
}

void Gate::release() noexcept {
  {
    std::scoped_lock lock(mu_);
    if (in_flight_ > 0) {
      --in_flight_;
    }
  }
  cv_.notify_one();
}

uint32_t Gate::in_flight() const {
  std::scoped_lock lock(mu_);
  return in_flight_;
}

uint32_t Gate::peak() const {
  std::scoped_lock lock(mu_);
  return peak_;
}

}  // namespace bread
