#ifndef __SYNOD_ACCEPTOR_H_
#define __SYNOD_ACCEPTOR_H_

#include "ptype.h"
#include "plog.h"
#include "conn.h"
#include "config.h"
#include "worker_pool.hpp"

#include <mutex>
#include <memory>
#include <future>
#include <string>

namespace synod {

// answer of an acceptor to a prepare or accept request.
// a rejection is a normal result: ret_ tells why, promised_ is the advice.
struct Vote {
  int ret_{kErrCode_OK};
  uint64_t promised_{kInvalidProposalId};
  uint64_t accepted_{kInvalidProposalId};  // id of value_, kInvalidProposalId if none
  std::string value_;

  bool Ok() const { return ret_ == kErrCode_OK; }
};

class Acceptor {
 public:
  explicit Acceptor(std::shared_ptr<Configure> config);
  ~Acceptor();

  // must be called before StartWorker(), memory store is used by default.
  void SetStateStore(std::unique_ptr<StateStore> store) { store_ = std::move(store); }

  // load durable state and start the mailbox worker.
  int StartWorker();
  int StopWorker();

  // promise pid if it is strictly greater than any id promised so far.
  // the promise carries the last accepted value, if any.
  Vote Prepare(uint64_t pid);

  // accept value unless a greater id has been promised.
  Vote Accept(uint64_t pid, const std::string& value);

  AcceptorState GetState() const;

  // mailbox entry, every request gets exactly one response via cb.
  int AddMsg(std::shared_ptr<PaxosMsg> m, ResponseCallback cb);
  std::future<std::shared_ptr<PaxosMsg>> AddMsgAsync(std::shared_ptr<PaxosMsg> m);

 private:
  struct PaxosRequest {
    ResponseCallback cb_;
    std::shared_ptr<PaxosMsg> msg_;
  };

  Acceptor(const Acceptor&) = delete;
  Acceptor& operator=(const Acceptor&) = delete;

  int doHandleMsg(PaxosRequest req);
  int persist(const AcceptorState& state);
  Vote reject(int reason) const;

  std::shared_ptr<PaxosMsg> makeRsp(const PaxosMsg& req, uint32_t type, const Vote& vote) const;

 private:
  std::shared_ptr<Configure> config_;
  std::unique_ptr<StateStore> store_;

  mutable std::mutex mutex_;
  AcceptorState state_;

  WorkerPool<PaxosRequest> wpool_;
};

}  // namespace synod

#endif
