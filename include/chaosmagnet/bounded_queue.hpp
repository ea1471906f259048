#pragma once

// chaosmagnet/bounded_queue.hpp: Ordered, bounded hand-off between harvester
// threads and the single conditioning consumer.
//
// Every wait is bounded by a caller-supplied timeout. close() wakes all
// waiters; after close() pushes fail and pops drain what is left.

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace chaosmagnet {

template <typename T>
class BoundedQueue {
 public:
  explicit BoundedQueue(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

  BoundedQueue(const BoundedQueue&) = delete;
  BoundedQueue& operator=(const BoundedQueue&) = delete;

  // Blocks up to timeout for room. Returns false on timeout or after close().
  bool push_for(T item, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mu_);
    if (!cv_capacity_.wait_for(lock, timeout, [this] { return closed_ || queue_.size() < capacity_; })) {
      return false;
    }
    if (closed_) return false;
    queue_.push_back(std::move(item));
    cv_.notify_one();
    return true;
  }

  std::optional<T> pop_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mu_);
    if (!cv_.wait_for(lock, timeout, [this] { return closed_ || !queue_.empty(); })) {
      return std::nullopt;
    }
    if (queue_.empty()) return std::nullopt;
    T item = std::move(queue_.front());
    queue_.pop_front();
    cv_capacity_.notify_one();
    return item;
  }

  // Removes up to max_items in FIFO order without waiting.
  std::vector<T> drain(std::size_t max_items) {
    std::vector<T> out;
    {
      std::lock_guard<std::mutex> lock(mu_);
      while (!queue_.empty() && out.size() < max_items) {
        out.push_back(std::move(queue_.front()));
        queue_.pop_front();
      }
    }
    cv_capacity_.notify_all();
    return out;
  }

  void close() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      closed_ = true;
    }
    cv_.notify_all();
    cv_capacity_.notify_all();
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return queue_.size();
  }

  std::size_t capacity() const { return capacity_; }

 private:
  const std::size_t capacity_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::condition_variable cv_capacity_;
  std::deque<T> queue_;
  bool closed_{false};
};

}  // namespace chaosmagnet
