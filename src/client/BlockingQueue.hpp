#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace lungo {

/**
 * BlockingQueue
 * @brief Mutex + condition variable queue shared between a producer and one consumer thread.
 *        stop() wakes every waiter, items already queued can still be drained afterwards.
 */
template <typename T>
class BlockingQueue {
public:
  BlockingQueue() = default;
  BlockingQueue(const BlockingQueue&) = delete;
  BlockingQueue& operator=(const BlockingQueue&) = delete;

  /// @return false if the queue was stopped and the item was dropped
  bool push(T item) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (stopped_) {
        return false;
      }
      queue_.push_back(std::move(item));
    }
    cv_.notify_one();
    return true;
  }

  /// @brief Blocks until an item is available or the queue is stopped and empty
  std::optional<T> pop() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !queue_.empty() || stopped_; });
    return takeFront();
  }

  /// @brief Like pop() but gives up after timeout
  std::optional<T> popFor(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || stopped_; });
    return takeFront();
  }

  void stop() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      stopped_ = true;
    }
    cv_.notify_all();
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.clear();
  }

  [[nodiscard]] bool stopped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stopped_;
  }

  [[nodiscard]] size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
  }

private:
  // Caller holds mutex_
  std::optional<T> takeFront() {
    if (queue_.empty()) {
      return std::nullopt;
    }
    std::optional<T> item(std::move(queue_.front()));
    queue_.pop_front();
    return item;
  }

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<T> queue_;
  bool stopped_ = false;
};

} // namespace lungo
