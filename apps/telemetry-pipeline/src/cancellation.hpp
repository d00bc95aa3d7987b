#ifndef TELEMETRY_PIPELINE_CANCELLATION_HPP
#define TELEMETRY_PIPELINE_CANCELLATION_HPP

#include <atomic>
#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <utility>

namespace telemetry {

// Caller-owned cancellation signal. Waiters subscribe a wake-up callback for the
// duration of a blocking call; cancel() runs every registered callback once.
class CancellationToken {
 public:
  CancellationToken() = default;
  CancellationToken(const CancellationToken&) = delete;
  CancellationToken& operator=(const CancellationToken&) = delete;

  void cancel() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancelled_.exchange(true)) {
      return;
    }
    for (auto& entry : callbacks_) {
      entry.second();
    }
  }

  // Lock-free so waiters may check it while holding their own locks.
  bool cancelled() const { return cancelled_.load(); }

  std::size_t subscribe(std::function<void()> callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::size_t id = next_id_;
    next_id_ += 1;
    callbacks_.emplace(id, std::move(callback));
    return id;
  }

  // Blocks while cancel() is running callbacks, so the callback never outlives the
  // subscriber's frame.
  void unsubscribe(std::size_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks_.erase(id);
  }

 private:
  std::mutex mutex_;
  std::atomic<bool> cancelled_{false};
  std::map<std::size_t, std::function<void()>> callbacks_;
  std::size_t next_id_ = 1;
};

} // namespace telemetry

#endif
