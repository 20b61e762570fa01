#ifndef __SYNOD_WAITGROUP_H_
#define __SYNOD_WAITGROUP_H_

#include <mutex>
#include <chrono>
#include <stdint.h>
#include <condition_variable>

namespace synod {

// WaitGroup blocks a waiter until Notify() has been called count times.
class WaitGroup {
 public:
  WaitGroup() : curr_(0), count_(0) {}
  explicit WaitGroup(uint32_t count) : curr_(0), count_(count) {}

  void Notify() {
    std::lock_guard<decltype(mutex_)> lock(mutex_);
    ++curr_;
    if (curr_ >= count_) {
      condition_.notify_one();
    }
  }

  // returns false if the group is not complete within timeout_ms.
  bool Wait(uint32_t timeout_ms) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    std::unique_lock<decltype(mutex_)> lock(mutex_);

    while (count_ > curr_) {
      if (condition_.wait_until(lock, deadline) == std::cv_status::timeout) {
        if (curr_ >= count_) break;
        return false;
      }
    }

    curr_ = 0;
    return true;
  }

  bool TryWait() {
    std::lock_guard<decltype(mutex_)> lock(mutex_);
    bool ret = (curr_ >= count_);
    if (ret) curr_ = 0;

    return ret;
  }

  uint32_t Done() const {
    std::lock_guard<decltype(mutex_)> lock(mutex_);
    return curr_;
  }

  void Reset(uint32_t count) {
    std::lock_guard<decltype(mutex_)> lock(mutex_);
    curr_ = 0;
    count_ = count;
  }

 private:
  uint32_t curr_;
  uint32_t count_;

  mutable std::mutex mutex_;
  std::condition_variable condition_;
};

}  // namespace synod

#endif
