#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace tradecalc {

// -----------------------------------------------------------------------------
// ThreadSafeQueue<T>
// -----------------------------------------------------------------------------
// Responsibility: Unbounded FIFO shared between threads. In a
// TradeEntrySession the feed thread and the caller's thread push price ticks
// and user edits; the loop thread pops them in arrival order.
//
// Thread model: Multiple producers and multiple consumers. Every method is
// thread-safe. pop() blocks until an item is available; try_pop() never
// blocks.
// -----------------------------------------------------------------------------
template <typename T>
class ThreadSafeQueue {
 public:
  ThreadSafeQueue() = default;

  // The mutex and condition variable pin the queue in place; share it by
  // reference.
  ThreadSafeQueue(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue(ThreadSafeQueue&&) = delete;
  ThreadSafeQueue& operator=(ThreadSafeQueue&&) = delete;

  // Appends to the back and wakes one waiting consumer.
  void push(T value) {
    {
      std::lock_guard lock(mutex_);
      queue_.push_back(std::move(value));
    }
    // Notify after unlocking so the woken consumer does not block on mutex_.
    condition_.notify_one();
  }

  // Removes the front item, waiting for a producer if the queue is empty.
  T pop() {
    std::unique_lock lock(mutex_);
    condition_.wait(lock, [this] { return !queue_.empty(); });

    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // Removes the front item, or returns std::nullopt at once if empty.
  std::optional<T> try_pop() {
    std::lock_guard lock(mutex_);
    if (queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // Snapshot only; another thread may change the queue right after.
  bool empty() const {
    std::lock_guard lock(mutex_);
    return queue_.empty();
  }

  std::size_t size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
  }

  // Discards everything queued and returns how many items were dropped.
  std::size_t clear() {
    std::lock_guard lock(mutex_);
    const std::size_t dropped = queue_.size();
    queue_.clear();
    return dropped;
  }

 private:
  mutable std::mutex mutex_;          // Protects queue_
  std::condition_variable condition_;  // Signalled on push
  std::deque<T> queue_;
};

}  // namespace tradecalc
