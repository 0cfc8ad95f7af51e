#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>

namespace mnemobox::sandbox {

class SlotPool;

/// Holds one slot until destroyed or released.
class SlotLease {
public:
  SlotLease() = default;
  ~SlotLease() { release(); }

  SlotLease(const SlotLease &) = delete;
  SlotLease &operator=(const SlotLease &) = delete;
  SlotLease(SlotLease &&other) noexcept;
  SlotLease &operator=(SlotLease &&other) noexcept;

  [[nodiscard]] bool held() const { return pool_ != nullptr; }
  void release();

private:
  friend class SlotPool;
  explicit SlotLease(SlotPool *pool) : pool_(pool) {}

  SlotPool *pool_ = nullptr;
};

/// Counting semaphore bounding how many executions run at once. Waiters are
/// not ordered.
class SlotPool {
public:
  explicit SlotPool(std::size_t capacity);

  SlotPool(const SlotPool &) = delete;
  SlotPool &operator=(const SlotPool &) = delete;

  /// Blocks until a slot frees. With a timeout, returns an empty lease once
  /// it elapses.
  [[nodiscard]] SlotLease acquire(std::optional<std::chrono::milliseconds> timeout = std::nullopt);
  [[nodiscard]] SlotLease try_acquire();

  [[nodiscard]] std::size_t capacity() const { return capacity_; }
  [[nodiscard]] std::size_t active() const;
  [[nodiscard]] std::size_t waiting() const;

private:
  friend class SlotLease;
  void give_back();

  const std::size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::size_t active_ = 0;
  std::size_t waiting_ = 0;
};

} // namespace mnemobox::sandbox
