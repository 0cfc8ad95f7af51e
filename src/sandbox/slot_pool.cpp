#include "mnemobox/sandbox/slot_pool.hpp"

#include <algorithm>

namespace mnemobox::sandbox {

SlotLease::SlotLease(SlotLease &&other) noexcept : pool_(other.pool_) { other.pool_ = nullptr; }

SlotLease &SlotLease::operator=(SlotLease &&other) noexcept {
  if (this != &other) {
    release();
    pool_ = other.pool_;
    other.pool_ = nullptr;
  }
  return *this;
}

void SlotLease::release() {
  if (pool_ != nullptr) {
    pool_->give_back();
    pool_ = nullptr;
  }
}

SlotPool::SlotPool(const std::size_t capacity) : capacity_(std::max<std::size_t>(1, capacity)) {}

SlotLease SlotPool::acquire(const std::optional<std::chrono::milliseconds> timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  ++waiting_;
  const auto has_slot = [this] { return active_ < capacity_; };
  bool granted = true;
  if (timeout.has_value()) {
    granted = cv_.wait_for(lock, *timeout, has_slot);
  } else {
    cv_.wait(lock, has_slot);
  }
  --waiting_;
  if (!granted) {
    return SlotLease{};
  }
  ++active_;
  return SlotLease(this);
}

SlotLease SlotPool::try_acquire() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (active_ >= capacity_) {
    return SlotLease{};
  }
  ++active_;
  return SlotLease(this);
}

std::size_t SlotPool::active() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return active_;
}

std::size_t SlotPool::waiting() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return waiting_;
}

void SlotPool::give_back() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (active_ > 0) {
      --active_;
    }
  }
  cv_.notify_one();
}

} // namespace mnemobox::sandbox
