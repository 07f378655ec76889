#pragma once
#include "encoding/tx_codec.hpp"
#include <atomic>
#include <cstddef>
#include <mutex>
#include <vector>

class SerializationBufferPool;

// Borrowed buffer, handed back to its pool on destruction.
class BufferLease {
public:
  BufferLease(BufferLease&& other) noexcept;
  BufferLease& operator=(BufferLease&& other) noexcept;
  BufferLease(const BufferLease&) = delete;
  BufferLease& operator=(const BufferLease&) = delete;
  ~BufferLease();

  Bytes& Buffer() { return buffer_; }
  const Bytes& Buffer() const { return buffer_; }
private:
  friend class SerializationBufferPool;
  BufferLease(SerializationBufferPool* pool, Bytes buffer);
  void Release();
  SerializationBufferPool* pool_;
  Bytes buffer_;
};

struct BufferPoolStats {
  size_t available = 0;
  size_t capacity = 0;
};

// Fixed-capacity pool of pre-sized byte buffers. Borrow() never waits: when the
// pool is empty a fresh buffer is allocated, and buffers returned to a full
// pool are freed, so retained memory stays at capacity * buffer_size.
class SerializationBufferPool {
public:
  static constexpr size_t kDefaultCapacity = 64;
  static constexpr size_t kDefaultBufferSize = 4096;

  explicit SerializationBufferPool(size_t capacity = kDefaultCapacity, size_t buffer_size = kDefaultBufferSize);

  BufferLease Borrow();
  BufferPoolStats Stats() const;
  // Number of buffers allocated because the pool was empty
  size_t FreshAllocations() const { return fresh_allocations_.load(std::memory_order_relaxed); }
  size_t BufferSize() const { return buffer_size_; }
private:
  friend class BufferLease;
  void Return(Bytes&& buffer);

  mutable std::mutex mutex_;
  std::vector<Bytes> free_;
  size_t capacity_;
  size_t buffer_size_;
  std::atomic<size_t> fresh_allocations_{0};
};
