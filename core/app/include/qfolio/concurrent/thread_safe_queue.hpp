#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace qfolio {

// -----------------------------------------------------------------------------
// ThreadSafeQueue<T>
// -----------------------------------------------------------------------------
//
// @brief  Multi-producer / multi-consumer FIFO with an optional capacity.
//
// @details
// Sits between the cycle thread, which produces audit records, and the
// AuditPublisher's worker thread, which serializes them onto the wire. The
// producer never waits on I/O or on the consumer.
//
// With capacity > 0 a push into a full queue evicts the oldest item and
// counts it in dropped(); the newest records are the ones a live monitor
// needs. capacity == 0 means unbounded.
//
//   push(v)        — never blocks (beyond the mutex). false if an item was
//                    evicted to make room.
//   pop_for(d)     — waits up to d for an item.
//   try_pop()      — std::nullopt at once when empty.
//
// Non-copyable and non-movable: share it by reference.
// -----------------------------------------------------------------------------
template <typename T>
class ThreadSafeQueue {
 public:
  explicit ThreadSafeQueue(std::size_t capacity = 0) : capacity_(capacity) {}

  ThreadSafeQueue(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue(ThreadSafeQueue&&) = delete;
  ThreadSafeQueue& operator=(ThreadSafeQueue&&) = delete;

  bool push(T value) {
    bool evicted = false;
    {
      std::lock_guard lock(mutex_);
      if (capacity_ > 0 && items_.size() >= capacity_) {
        items_.pop_front();
        ++dropped_;
        evicted = true;
      }
      items_.push_back(std::move(value));
    }
    ready_.notify_one();
    return !evicted;
  }

  template <typename Rep, typename Period>
  std::optional<T> pop_for(std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock lock(mutex_);
    if (!ready_.wait_for(lock, timeout, [this] { return !items_.empty(); })) {
      return std::nullopt;
    }
    return takeFront();
  }

  std::optional<T> try_pop() {
    std::lock_guard lock(mutex_);
    if (items_.empty()) {
      return std::nullopt;
    }
    return takeFront();
  }

  bool empty() const {
    std::lock_guard lock(mutex_);
    return items_.empty();
  }

  std::size_t size() const {
    std::lock_guard lock(mutex_);
    return items_.size();
  }

  std::size_t capacity() const { return capacity_; }

  std::size_t dropped() const {
    std::lock_guard lock(mutex_);
    return dropped_;
  }

 private:
  // Caller holds mutex_ and has checked non-empty.
  T takeFront() {
    T value = std::move(items_.front());
    items_.pop_front();
    return value;
  }

  const std::size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable ready_;
  std::deque<T> items_;
  std::size_t dropped_{0};
};

}  // namespace qfolio
