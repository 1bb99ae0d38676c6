#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <queue>

namespace mc {

/**
 * ThreadSafeQueue - A thread-safe wrapper around std::queue
 *
 * All public methods are thread-safe. Consumers block in waitPoll()
 * for at most the given timeout.
 *
 * @tparam T The type of elements stored in the queue
 */
template <typename T>
class ThreadSafeQueue {
public:
  ThreadSafeQueue() = default;
  ~ThreadSafeQueue() = default;

  ThreadSafeQueue(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
  }

  void push(const T& value) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      queue_.push(value);
    }
    cv_.notify_one();
  }

  /**
   * Pop the front element, waiting up to timeout for one to arrive
   * @param t Reference to store the popped element
   * @return false if the queue stayed empty
   */
  template <typename Rep, typename Period>
  bool waitPoll(T& t, const std::chrono::duration<Rep, Period>& timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return !queue_.empty(); })) {
      return false;
    }
    t = std::move(queue_.front());
    queue_.pop();
    return true;
  }

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::queue<T> queue_;
};

} // namespace mc
