#pragma once

#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace bread {

// Counting admission gate: at most capacity() slots are held at once.
class Gate {
 public:
  explicit Gate(uint32_t capacity);

  Gate(const Gate&) = delete;
  Gate& operator=(const Gate&) = delete;

  // Blocks while every slot is held.
  void acquire();
  void release() noexcept;

  uint32_t capacity() const noexcept { return capacity_; }
  uint32_t in_flight() const;
  uint32_t peak() const;

 private:
  const uint32_t capacity_;

  mutable std::mutex mu_;
  std::condition_variable cv_;
  uint32_t in_flight_{0};
  uint32_t peak_{0};
};

}  // namespace bread
