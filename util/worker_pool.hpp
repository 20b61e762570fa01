#ifndef __SYNOD_WORKER_POOL_H_
#define __SYNOD_WORKER_POOL_H_

#include <atomic>
#include <thread>
#include <memory>
#include <string>
#include <vector>
#include <functional>

#include <stdio.h>
#include <sys/prctl.h>

#include "queue.h"

namespace synod {

// WorkerPool dispatches work to a fixed set of threads, work with the same
// wid always goes to the same worker, so a pool with one worker is a mailbox
// with exactly one consumer.
template <typename DATA>
class WorkerPool {
  using WorkerHandler = std::function<int(DATA)>;

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

 private:
  struct WorkerData {
    std::thread th_;
    MsgQueue<DATA> mq_;
  };

  std::string name_;
  WorkerHandler handler_;
  std::atomic<int> status_{0};
  std::vector<std::unique_ptr<WorkerData>> workers_;

 public:
  explicit WorkerPool(WorkerHandler handler, std::string name = "wpool")
      : name_(std::move(name)), handler_(std::move(handler)) {}

  ~WorkerPool() { StopWorker(); }

  bool IsRunning() const { return status_.load(std::memory_order_acquire) == 1; }

  void StopWorker() {
    int expected = 1;
    if (!status_.compare_exchange_strong(expected, 2)) {
      return;
    }

    for (auto& w : workers_) {
      w->mq_.Wakeup();
    }

    for (auto& w : workers_) {
      if (w->th_.joinable()) w->th_.join();
    }
  }

  int StartWorker(int worker_count, int queue_sz) {
    if (status_.load() == 1) return 0;
    if (worker_count <= 0 || queue_sz <= 0) return -1;

    workers_.clear();
    for (auto i = 0; i < worker_count; i++) {
      std::unique_ptr<WorkerData> w(new WorkerData());
      w->mq_.Init(uint32_t(queue_sz));
      workers_.push_back(std::move(w));
    }

    status_.store(1, std::memory_order_release);

    auto idx = 0;
    for (auto& w : workers_) {
      w->th_ = std::thread(&WorkerPool<DATA>::workerProc, this, w.get(), idx++);
    }

    return 0;
  }

  int AddWork(uint64_t wid, DATA data) {
    if (status_.load(std::memory_order_acquire) != 1) return -1;

    auto& w = workers_[wid % workers_.size()];
    if (w->mq_.Enqueue(std::move(data)) != MsgQueue<DATA>::RT_OK) {
      return -2;
    }

    return 0;
  }

 private:
  void workerProc(WorkerData* w, int wid) {
    {
      char buff[16];
      snprintf(buff, sizeof(buff), "%.10s-%d", name_.c_str(), wid);
      prctl(PR_SET_NAME, buff, 0, 0, 0);
    }

    while (status_.load(std::memory_order_acquire) == 1) {
      DATA req;
      if (w->mq_.Dequeue(req, 1000) != MsgQueue<DATA>::RT_OK) {
        continue;
      }

      handler_(std::move(req));
    }
  }
};

}  // namespace synod

#endif
