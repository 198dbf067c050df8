#include "bread/pool/buffer_pool.hpp"

#include <algorithm>
#include <utility>

namespace bread {

PooledBuffer::PooledBuffer(PooledBuffer&& other) noexcept
    : buffer_(std::move(other.buffer_)), pool_(std::exchange(other.pool_, nullptr)) {}

PooledBuffer& PooledBuffer::operator=(PooledBuffer&& other) noexcept {
  if (this != &other) {
    reset();
    buffer_ = std::move(other.buffer_);
    pool_ = std::exchange(other.pool_, nullptr);
  }
  return *this;
}

void PooledBuffer::reset() noexcept {
  if (buffer_ && pool_) {
    pool_->release(std::move(buffer_));
  }
  buffer_.reset();
  pool_ = nullptr;
}

BufferPool::BufferPool(size_t buffer_size, uint32_t seed) : buffer_size_(buffer_size) {
  for (uint32_t i = 0; i < seed; ++i) {
    free_.push_back(allocate());
  }
}

std::unique_ptr<std::vector<std::byte>> BufferPool::allocate() {
  auto buffer = std::make_unique<std::vector<std::byte>>();
  buffer->reserve(buffer_size_ * 2);
  {
    // Room for every buffer ever handed out, so release() never reallocates.
    std::scoped_lock lock(mu_);
    ++allocations_;
    if (free_.capacity() < allocations_) {
      free_.reserve(std::max<size_t>(8, 2 * allocations_));
    }
  }
  return buffer;
}

PooledBuffer BufferPool::acquire() {
  std::unique_ptr<std::vector<std::byte>> buffer;
  {
    std::scoped_lock lock(mu_);
    if (!free_.empty()) {
      buffer = std::move(free_.back());
      free_.pop_back();
    }
  }
  if (!buffer) {
    buffer = allocate();
  }
  buffer->resize(buffer_size_);
  return PooledBuffer(std::move(buffer), this);
}

void BufferPool::release(std::unique_ptr<std::vector<std::byte>> buffer) noexcept {
  // Capacity is at least 2 * buffer_size, so this never reallocates.
  buffer->resize(buffer_size_);
  std::scoped_lock lock(mu_);
  free_.push_back(std::move(buffer));
}

size_t BufferPool::available() const {
  std::scoped_lock lock(mu_);
  return free_.size();
}

uint64_t BufferPool::allocations() const {
  std::scoped_lock lock(mu_);
  return allocations_;
}

}  // namespace bread
