#include "encoding/buffer_pool.hpp"
#include <utility>

BufferLease::BufferLease(SerializationBufferPool* pool, Bytes buffer)
  : pool_(pool), buffer_(std::move(buffer)) {}

BufferLease::BufferLease(BufferLease&& other) noexcept
  : pool_(other.pool_), buffer_(std::move(other.buffer_)) {
  other.pool_ = nullptr;
}

BufferLease& BufferLease::operator=(BufferLease&& other) noexcept {
  if (this != &other) {
    Release();
    pool_ = other.pool_;
    buffer_ = std::move(other.buffer_);
    other.pool_ = nullptr;
  }
  return *this;
}

BufferLease::~BufferLease() { Release(); }

void BufferLease::Release() {
  if (pool_) pool_->Return(std::move(buffer_));
  pool_ = nullptr;
}

SerializationBufferPool::SerializationBufferPool(size_t capacity, size_t buffer_size)
  : capacity_(capacity), buffer_size_(buffer_size) {
  free_.reserve(capacity_);
  for (size_t i = 0; i < capacity_; ++i) {
    Bytes b;
    b.reserve(buffer_size_);
    free_.push_back(std::move(b));
  }
}

BufferLease SerializationBufferPool::Borrow() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!free_.empty()) {
      Bytes b = std::move(free_.back());
      free_.pop_back();
      return BufferLease(this, std::move(b));
    }
  }
  fresh_allocations_.fetch_add(1, std::memory_order_relaxed);
  Bytes b;
  b.reserve(buffer_size_);
  return BufferLease(this, std::move(b));
}

void SerializationBufferPool::Return(Bytes&& buffer) {
  buffer.clear();
  // a buffer that grew far past the configured size is not worth keeping
  if (buffer.capacity() > buffer_size_ * 4) return;
  std::lock_guard<std::mutex> lock(mutex_);
  if (free_.size() >= capacity_) return;
  free_.push_back(std::move(buffer));
}

BufferPoolStats SerializationBufferPool::Stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return BufferPoolStats{free_.size(), capacity_};
}
