#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace hedge {

// -----------------------------------------------------------------------------
// ThreadSafeQueue<T>
// -----------------------------------------------------------------------------
//
// @brief  FIFO hand-off between the control loop thread and the IPC thread.
//
// @details
// Used at the two thread boundaries of the process:
//   - IpcServer thread → ControlLoop: operator commands (CLOSE, RESUME, HALT).
//     Unbounded; the loop takes the whole batch with drain() at the start of
//     a tick, so a command that arrives mid-tick waits for the next one.
//   - ControlLoop thread → IpcServer: telemetry events waiting for the PUB
//     socket. Bounded; when the IPC thread falls behind, the oldest event is
//     dropped so the control loop never blocks or grows memory on telemetry.
//
// capacity == 0 means unbounded.
//
// Thread model:
//   Safe for multiple producers and multiple consumers.
// -----------------------------------------------------------------------------
template <typename T>
class ThreadSafeQueue {
 public:
  explicit ThreadSafeQueue(std::size_t capacity = 0) : capacity_(capacity) {}

  ThreadSafeQueue(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue(ThreadSafeQueue&&) = delete;
  ThreadSafeQueue& operator=(ThreadSafeQueue&&) = delete;

  // -------------------------------------------------------------------------
  // push(value)
  // -------------------------------------------------------------------------
  // @return false if the queue was full and its oldest item was discarded
  //         to make room, true otherwise.
  // -------------------------------------------------------------------------
  bool push(T value) {
    bool kept_all = true;
    {
      std::lock_guard lock(mutex_);
      if (capacity_ != 0 && queue_.size() >= capacity_) {
        queue_.pop_front();
        ++dropped_;
        kept_all = false;
      }
      queue_.push_back(std::move(value));
    }
    condition_.notify_one();
    return kept_all;
  }

  // Blocking: waits until an item is available.
  T pop() {
    std::unique_lock lock(mutex_);
    condition_.wait(lock, [this] { return !queue_.empty(); });
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  std::optional<T> try_pop() {
    std::lock_guard lock(mutex_);
    if (queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // -------------------------------------------------------------------------
  // drain()
  // -------------------------------------------------------------------------
  // @brief  Removes every queued item in one lock acquisition, oldest first.
  // -------------------------------------------------------------------------
  std::vector<T> drain() {
    std::vector<T> items;
    std::lock_guard lock(mutex_);
    items.reserve(queue_.size());
    for (auto& item : queue_) {
      items.push_back(std::move(item));
    }
    queue_.clear();
    return items;
  }

  bool empty() const {
    std::lock_guard lock(mutex_);
    return queue_.empty();
  }

  std::size_t size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
  }

  // Items discarded by push() on a full queue since construction.
  std::size_t dropped() const {
    std::lock_guard lock(mutex_);
    return dropped_;
  }

  std::size_t capacity() const { return capacity_; }

 private:
  const std::size_t capacity_;
  mutable std::mutex mutex_;           // Protects queue_ and dropped_
  std::condition_variable condition_;  // Signalled on push
  std::deque<T> queue_;
  std::size_t dropped_{0};
};

}  // namespace hedge
