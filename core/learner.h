#ifndef __SYNOD_LEARNER_H_
#define __SYNOD_LEARNER_H_

#include "ptype.h"
#include "conn.h"
#include "config.h"
#include "worker_pool.hpp"

#include <mutex>
#include <memory>
#include <string>

namespace synod {

// Learner is a learner-only node: it never proposes nor accepts, it only
// records the chosen value announced by proposers.
class Learner {
 public:
  explicit Learner(std::shared_ptr<Configure> config);
  ~Learner();

  int StartWorker();
  int StopWorker();

  // record (pid, value) unless a greater pid has been learned already.
  // returns kErrCode_STALE_PROPOSAL for an out-of-date announcement.
  int Learn(uint64_t pid, const std::string& value);

  // returns false if nothing has been learned yet.
  bool GetChosen(uint64_t* pid, std::string* value) const;

  int GetId() const { return config_->local_.id_; }

  // mailbox entry, only CHOSEN_REQ is served, prepare/accept get INVALID_REQ.
  int AddMsg(std::shared_ptr<PaxosMsg> m, ResponseCallback cb);

 private:
  struct LearnRequest {
    ResponseCallback cb_;
    std::shared_ptr<PaxosMsg> msg_;
  };

  Learner(const Learner&) = delete;
  Learner& operator=(const Learner&) = delete;

  int doHandleMsg(LearnRequest req);

 private:
  std::shared_ptr<Configure> config_;

  mutable std::mutex mutex_;
  uint64_t chosen_pid_{kInvalidProposalId};
  std::string chosen_value_;

  WorkerPool<LearnRequest> wpool_;
};

}  // namespace synod

#endif
