#ifndef __SYNOD_QUEUE_H_
#define __SYNOD_QUEUE_H_

#include <deque>
#include <mutex>
#include <chrono>
#include <stdint.h>
#include <condition_variable>

namespace synod {

// bounded multi-producer queue, drained by a single consumer thread.
template <class T>
class MsgQueue {
 public:
  enum {
    RT_OK = 0,
    RT_FULL = 1,
    RT_EMPTY = 2,
    RT_ERR = -1,
  };

  MsgQueue() : init_(false), size_(0) {}

  int Init(uint32_t size) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (init_) {
      return RT_OK;
    }

    if (size == 0) {
      return RT_ERR;
    }

    size_ = size;
    init_ = true;
    return RT_OK;
  }

  int Enqueue(T val) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!init_) {
        return RT_ERR;
      }

      if (items_.size() >= size_) {
        return RT_FULL;
      }

      items_.push_back(std::move(val));
    }

    cond_.notify_one();
    return RT_OK;
  }

  // wait at most timeout_us for an item.
  int Dequeue(T& val, uint32_t timeout_us) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!init_) {
      return RT_ERR;
    }

    if (items_.empty()) {
      cond_.wait_for(lock, std::chrono::microseconds(timeout_us), [this]() { return !items_.empty(); });
    }

    if (items_.empty()) {
      return RT_EMPTY;
    }

    val = std::move(items_.front());
    items_.pop_front();
    return RT_OK;
  }

  // wake up the consumer even if there is nothing to consume.
  void Wakeup() { cond_.notify_all(); }

  size_t Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
  }

 private:
  MsgQueue(const MsgQueue&) = delete;
  MsgQueue& operator=(const MsgQueue&) = delete;

  bool init_;
  uint32_t size_;
  std::deque<T> items_;

  mutable std::mutex mutex_;
  std::condition_variable cond_;
};

}  // namespace synod

#endif
