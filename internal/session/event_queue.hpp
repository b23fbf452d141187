#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace swarm::session {

/*
  Thread-safe blocking queue feeding a session's writer thread.

  After Shutdown() Enqueue is refused, but items already queued are
  still handed out until the queue is empty.
*/
template <typename T>
class EventQueue {
 public:
  using Deadline = std::chrono::steady_clock::time_point;

  // false once shut down
  bool Enqueue(T item) {
    {
      std::lock_guard lock(mutex_);
      if (shutdown_) return false;
      queue_.push_back(std::move(item));
    }
    cv_.notify_one();
    return true;
  }

  // blocking wait
  std::optional<T> Dequeue() {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });
    return PopLocked();
  }

  // nullopt on timeout, or when shut down and empty
  std::optional<T> DequeueUntil(Deadline deadline) {
    std::unique_lock lock(mutex_);
    cv_.wait_until(lock, deadline, [&] { return shutdown_ || !queue_.empty(); });
    return PopLocked();
  }

  void Shutdown() {
    {
      std::lock_guard lock(mutex_);
      shutdown_ = true;
    }
    cv_.notify_all();
  }

  bool IsShutdown() const {
    std::lock_guard lock(mutex_);
    return shutdown_;
  }

 private:
  std::optional<T> PopLocked() {
    if (queue_.empty()) return std::nullopt;
    T item = std::move(queue_.front());
    queue_.pop_front();
    return item;
  }

  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::deque<T>           queue_;
  bool                    shutdown_ = false;
};

} // namespace swarm::session
