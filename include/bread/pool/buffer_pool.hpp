#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace bread {

class BufferPool;

// Exclusive handle to a pooled buffer. Moving the handle transfers
// ownership; destroying or resetting it returns the buffer to its pool.
class PooledBuffer {
 public:
  PooledBuffer() = default;
  PooledBuffer(std::unique_ptr<std::vector<std::byte>> buffer, BufferPool* pool) noexcept
      : buffer_(std::move(buffer)), pool_(pool) {}
  ~PooledBuffer() { reset(); }

  PooledBuffer(PooledBuffer&& other) noexcept;
  PooledBuffer& operator=(PooledBuffer&& other) noexcept;

  PooledBuffer(const PooledBuffer&) = delete;
  PooledBuffer& operator=(const PooledBuffer&) = delete;

  std::vector<std::byte>& bytes() noexcept { return *buffer_; }
  const std::vector<std::byte>& bytes() const noexcept { return *buffer_; }

  explicit operator bool() const noexcept { return buffer_ != nullptr; }

  void reset() noexcept;

 private:
  std::unique_ptr<std::vector<std::byte>> buffer_;
  BufferPool* pool_{nullptr};
};

// Free list of byte buffers. Each buffer is allocated with length
// buffer_size and capacity 2 * buffer_size. A released buffer is trimmed back
// to buffer_size and keeps whatever capacity it grew to; its bytes are not
// cleared. The pool must outlive every handle it gives out.
class BufferPool {
 public:
  BufferPool(size_t buffer_size, uint32_t seed);

  BufferPool(const BufferPool&) = delete;
  BufferPool& operator=(const BufferPool&) = delete;

  // Content of the returned buffer is undefined.
  PooledBuffer acquire();

  size_t buffer_size() const noexcept { return buffer_size_; }
  size_t available() const;
  uint64_t allocations() const;

 private:
  friend class PooledBuffer;

  std::unique_ptr<std::vector<std::byte>> allocate();
  void release(std::unique_ptr<std::vector<std::byte>> buffer) noexcept;

  const size_t buffer_size_;

  mutable std::mutex mu_;
  std::vector<std::unique_ptr<std::vector<std::byte>>> free_;
  uint64_t allocations_{0};
};

}  // namespace bread
