#ifndef __SYNOD_PROPOSER_H_
#define __SYNOD_PROPOSER_H_

#include "conn.h"
#include "ptype.h"
#include "config.h"
#include "idgen.hpp"

#include <mutex>
#include <memory>
#include <string>
#include <future>

namespace synod {

// outcome of one round driven by a proposer.
// ret_ is kErrCode_OK when value_ has been chosen under pid_.
struct RoundResult {
  int ret_{kErrCode_OK};
  uint64_t pid_{kInvalidProposalId};
  std::string value_;
  uint32_t attempts_{0};  // prepare attempts made by the round

  bool Committed() const { return ret_ == kErrCode_OK; }
};

class Proposer {
 public:
  explicit Proposer(std::shared_ptr<Configure> config);
  ~Proposer();

  void SetConnMng(std::shared_ptr<ConnMng> mng) { conn_ = std::move(mng); }

  // run a round proposing val.
  // the chosen value may differ from val if some acceptor has already accepted one.
  // a proposer runs one round at a time, a concurrent call gets kErrCode_WORKING_IN_PROPGRESS.
  RoundResult Propose(const std::string& val);

  std::future<RoundResult> ProposeAsync(const std::string& val);

  // next proposal id to be used, for diagnosis.
  uint64_t GetNextProposalId() const;

  // ids issued from now on are greater than pid.
  void SkipProposalId(uint64_t pid);

 private:
  struct PhaseState;

  Proposer(const Proposer&) = delete;
  Proposer& operator=(const Proposer&) = delete;

  int doPrepare(uint64_t pid, std::string* val);
  int doAccept(uint64_t pid, const std::string& val);
  int doChosen(uint64_t pid, const std::string& val);

  std::shared_ptr<PhaseState> doBatchRpcRequest(std::shared_ptr<PaxosMsg>& pm);
  int waitPhase(const std::shared_ptr<PhaseState>& state);

  std::shared_ptr<PaxosMsg> allocPaxosMsg(uint32_t type, uint64_t pid, const std::string& val);

 private:
  std::shared_ptr<ConnMng> conn_;
  std::shared_ptr<Configure> config_;

  int index_;  // index of local node within the acceptors
  uint64_t term_{0};

  std::mutex round_lock_;
  mutable std::mutex ig_lock_;
  IdGen ig_;  // proposal id generator
};

}  // namespace synod

#endif
