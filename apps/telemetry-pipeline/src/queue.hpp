#ifndef TELEMETRY_PIPELINE_QUEUE_HPP
#define TELEMETRY_PIPELINE_QUEUE_HPP

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>
#include <utility>

#include "cancellation.hpp"

namespace telemetry {

enum class PushStatus {
  kOk,
  kFull,
  kClosed,
};

enum class PopStatus {
  kItem,
  kTimeout,
  kCancelled,
  kClosed,
};

// Fixed-capacity multi-producer/multi-consumer queue. Producers never block;
// consumers wait with a timeout and an optional cancellation token.
template <typename T>
class BoundedQueue {
 public:
  explicit BoundedQueue(std::size_t capacity) : capacity_(capacity) {}

  PushStatus tryPush(T&& item) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return PushStatus::kClosed;
    }
    if (queue_.size() >= capacity_) {
      return PushStatus::kFull;
    }
    queue_.push(std::move(item));
    not_empty_.notify_one();
    return PushStatus::kOk;
  }

  // Cancellation wins over a pending item so that a cancelled consumer never
  // takes ownership of an event it will not process.
  template <typename Rep, typename Period>
  PopStatus pollFor(T& out, std::chrono::duration<Rep, Period> timeout, CancellationToken* token = nullptr) {
    std::size_t subscription = 0;
    if (token != nullptr) {
      subscription = token->subscribe([this]() {
        std::lock_guard<std::mutex> lock(mutex_);
        not_empty_.notify_all();
      });
    }

    PopStatus status = PopStatus::kTimeout;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      not_empty_.wait_for(lock, timeout, [this, token]() {
        return closed_ || !queue_.empty() || (token != nullptr && token->cancelled());
      });
      if (token != nullptr && token->cancelled()) {
        status = PopStatus::kCancelled;
      } else if (!queue_.empty()) {
        out = std::move(queue_.front());
        queue_.pop();
        if (queue_.empty()) {
          drained_.notify_all();
        }
        status = PopStatus::kItem;
      } else if (closed_) {
        status = PopStatus::kClosed;
      }
    }

    if (token != nullptr) {
      token->unsubscribe(subscription);
    }
    return status;
  }

  // Returns true if the queue became empty before the timeout.
  template <typename Rep, typename Period>
  bool waitUntilEmpty(std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return drained_.wait_for(lock, timeout, [this]() { return queue_.empty(); });
  }

  // Pending items are still handed out after close(); only new pushes fail.
  void close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    not_empty_.notify_all();
    drained_.notify_all();
  }

  // Discards everything still queued and returns how many items were dropped.
  std::size_t clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::size_t dropped = queue_.size();
    std::queue<T> empty;
    queue_.swap(empty);
    drained_.notify_all();
    return dropped;
  }

  bool closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
  }

  std::size_t capacity() const { return capacity_; }

 private:
  mutable std::mutex mutex_;
  std::condition_variable not_empty_;
  std::condition_variable drained_;
  std::queue<T> queue_;
  std::size_t capacity_ = 0;
  bool closed_ = false;
};

} // namespace telemetry

#endif
