#include "proposer.h"

#include "logger.h"
#include "backoff.hpp"
#include "waitgroup.hpp"
#include "time.hpp"

#include <atomic>
#include <thread>
#include <chrono>

namespace synod {

// fan-in state of one phase(prepare or accept).
// shared with the rpc callbacks, which may fire after the phase is over.
struct Proposer::PhaseState {
  PhaseState(uint32_t rsp_type, uint64_t pid, uint64_t term, uint32_t total, uint32_t majority)
      : rsp_type_(rsp_type), pid_(pid), term_(term), total_(total), majority_(majority) {}

  const uint32_t rsp_type_;
  const uint64_t pid_;
  const uint64_t term_;
  const uint32_t total_;
  const uint32_t majority_;

  std::mutex mutex_;
  bool done_{false};
  uint32_t rsp_count_{0};
  uint32_t valid_rsp_count_{0};

  // greatest promised id seen in rejections
  uint64_t max_promised_{kInvalidProposalId};

  // last vote with the greatest accepted id among the promises
  uint64_t last_vote_pid_{kInvalidProposalId};
  std::string last_vote_;

  std::promise<int> ret_;

  void finish(int ret) {
    done_ = true;
    ret_.set_value(ret);
  }

  void checkDone() {
    if (valid_rsp_count_ >= majority_) {
      finish(kErrCode_OK);
    } else if (total_ - (rsp_count_ - valid_rsp_count_) < majority_) {
      // too many rejections or failures, quorum is out of reach.
      finish(rsp_type_ == kMsgType_PREPARE_RSP ? kErrCode_PREPARE_NOT_QUORUM : kErrCode_ACCEPT_NOT_QUORUM);
    }
  }

  // request could not be delivered
  void OnFailure() {
    std::lock_guard<std::mutex> l(mutex_);
    if (done_) return;

    rsp_count_++;
    checkDone();
  }

  void OnResponse(std::shared_ptr<PaxosMsg> rsp) {
    std::lock_guard<std::mutex> l(mutex_);
    if (done_) {
      // late comer after the phase has been decided.
      LOG_TRACE << "drop late rsp of " << MsgTypeName(rsp_type_ - 1) << ", pid:" << pid_
                << ", from:" << (rsp ? int(rsp->from_) : -1);
      return;
    }

    rsp_count_++;

    if (!IsValidMsg(rsp.get()) || rsp->type_ != rsp_type_) {
      LOG_WARN << "invalid rsp for " << MsgTypeName(rsp_type_ - 1) << ", pid:" << pid_
               << ", type:" << (rsp ? MsgTypeName(rsp->type_) : "NULL")
               << ", from:" << (rsp ? int(rsp->from_) : -1);
      checkDone();
      return;
    }

    auto pp = GetProposalFromMsg(rsp.get());
    if (pp->pid_ != pid_ || pp->term_ != term_) {
      LOG_WARN << "mismatched rsp, pid:" << pid_ << ", rsp pid:" << pp->pid_ << ", term:" << term_
               << ", rsp term:" << pp->term_ << ", from:" << rsp->from_;
      checkDone();
      return;
    }

    if (rsp->errcode_ != kErrCode_OK || pp->status_ == kPaxosState_REJECTED) {
      if (pp->promised_ > max_promised_) max_promised_ = pp->promised_;

      LOG_INFO << "peer rejected " << MsgTypeName(rsp_type_ - 1) << ", pid:" << pid_
               << ", promised:" << pp->promised_ << ", ret:" << ErrCodeName(rsp->errcode_)
               << ", from:" << rsp->from_;
      checkDone();
      return;
    }

    if (rsp_type_ == kMsgType_PREPARE_RSP && pp->accepted_ != kInvalidProposalId &&
        pp->accepted_ > last_vote_pid_) {
      // accepted ids are unique proposal ids, the greatest one is unique as well.
      last_vote_pid_ = pp->accepted_;
      last_vote_ = GetValueFromProposal(*pp);

      LOG_INFO << "peer returns last vote, pid:" << pid_ << ", vote pid:" << last_vote_pid_
               << ", from:" << rsp->from_;
    }

    valid_rsp_count_++;
    checkDone();
  }
};

Proposer::Proposer(std::shared_ptr<Configure> config)
    : config_(std::move(config)),
      index_(GetAcceptorIndex(*config_, config_->local_.id_)),
      ig_(uint64_t(index_ < 0 ? 0 : index_) + 1, config_->total_acceptor_) {}

Proposer::~Proposer() {}

uint64_t Proposer::GetNextProposalId() const {
  std::lock_guard<std::mutex> l(ig_lock_);
  return ig_.Get();
}

void Proposer::SkipProposalId(uint64_t pid) {
  std::lock_guard<std::mutex> l(ig_lock_);
  ig_.SetGreaterThan(pid);
}

std::shared_ptr<PaxosMsg> Proposer::allocPaxosMsg(uint32_t type, uint64_t pid, const std::string& val) {
  auto pm = AllocProposalMsg(type, val);
  if (!pm) return NULL;

  pm->from_ = uint32_t(config_->local_.id_);
  pm->version_ = config_->msg_version_;

  auto pp = GetProposalFromMsg(pm.get());
  pp->pid_ = pid;
  pp->term_ = term_++;
  pp->proposer_ = uint32_t(config_->local_.id_);

  if (type == kMsgType_PREPARE_REQ) {
    pp->status_ = kPaxosState_PREPARED;
  } else if (type == kMsgType_ACCEPT_REQ) {
    pp->status_ = kPaxosState_ACCEPTED;
  } else {
    pp->status_ = kPaxosState_CHOSEN;
  }

  return pm;
}

std::shared_ptr<Proposer::PhaseState> Proposer::doBatchRpcRequest(std::shared_ptr<PaxosMsg>& pm) {
  auto& conns = conn_->GetAcceptorConn();
  auto pp = GetProposalFromMsg(pm.get());

  uint64_t pid = pp->pid_;
  uint64_t term = pp->term_;
  auto state = std::make_shared<PhaseState>(uint32_t(pm->type_ + 1), pid, term, uint32_t(conns.size()),
                                            QuorumSize(config_->total_acceptor_));

  if (conns.empty()) {
    std::lock_guard<std::mutex> l(state->mutex_);
    state->checkDone();
    return state;
  }

  auto cb = [state](std::shared_ptr<PaxosMsg> msg) -> int {
    state->OnResponse(std::move(msg));
    return 0;
  };

  for (auto& conn : conns) {
    RpcReqData req{config_->timeout_ms_, cb, pm};
    if (conn->DoRpcRequest(std::move(req)) != kErrCode_OK) {
      LOG_DEBUG << "send " << MsgTypeName(pm->type_) << " to acceptor(" << conn->GetAddr().id_ << ") failed";
      state->OnFailure();
    }
  }

  return state;
}

int Proposer::waitPhase(const std::shared_ptr<PhaseState>& state) {
  auto ft = state->ret_.get_future();
  if (ft.wait_for(std::chrono::milliseconds(config_->timeout_ms_)) == std::future_status::ready) {
    return ft.get();
  }

  {
    std::lock_guard<std::mutex> l(state->mutex_);
    if (!state->done_) {
      // responses arriving from now on are ignored.
      state->finish(kErrCode_TIMEOUT);
    }
  }

  return ft.get();
}

int Proposer::doPrepare(uint64_t pid, std::string* val) {
  auto pm = allocPaxosMsg(kMsgType_PREPARE_REQ, pid, "");
  if (!pm) return kErrCode_OOM;

  auto state = doBatchRpcRequest(pm);
  auto ret = waitPhase(state);

  std::lock_guard<std::mutex> l(state->mutex_);

  if (ret != kErrCode_OK) {
    if (state->max_promised_ != kInvalidProposalId) {
      std::lock_guard<std::mutex> l2(ig_lock_);
      ig_.SetGreaterThan(state->max_promised_);
    }

    LOG_INFO << "prepare failed, pid:" << pid << ", ret:" << ErrCodeName(ret) << ", rsp:" << state->rsp_count_
             << ", promises:" << state->valid_rsp_count_ << ", max promised:" << state->max_promised_;
    return ret;
  }

  if (state->last_vote_pid_ != kInvalidProposalId) {
    // some acceptor already accepted a value, which must be proposed instead.
    LOG_INFO << "select peer value from prepare rsp, pid:" << pid << ", vote pid:" << state->last_vote_pid_;
    *val = state->last_vote_;
  }

  return kErrCode_OK;
}

int Proposer::doAccept(uint64_t pid, const std::string& val) {
  auto pm = allocPaxosMsg(kMsgType_ACCEPT_REQ, pid, val);
  if (!pm) return kErrCode_OOM;

  auto state = doBatchRpcRequest(pm);
  auto ret = waitPhase(state);

  if (ret != kErrCode_OK) {
    std::lock_guard<std::mutex> l(state->mutex_);
    if (state->max_promised_ != kInvalidProposalId) {
      std::lock_guard<std::mutex> l2(ig_lock_);
      ig_.SetGreaterThan(state->max_promised_);
    }

    LOG_ERR << "accept failed, pid:" << pid << ", ret:" << ErrCodeName(ret) << ", rsp:" << state->rsp_count_
            << ", acks:" << state->valid_rsp_count_ << ", max promised:" << state->max_promised_;
  }

  return ret;
}

int Proposer::doChosen(uint64_t pid, const std::string& val) {
  auto& conns = conn_->GetLearnerConn();
  if (conns.empty()) return kErrCode_OK;

  auto pm = allocPaxosMsg(kMsgType_CHOSEN_REQ, pid, val);
  if (!pm) return kErrCode_OOM;

  auto wg = std::make_shared<WaitGroup>(uint32_t(conns.size()));
  // first refusal of a learner, a refusal still counts as an answer.
  auto refused = std::make_shared<std::atomic<int>>(kErrCode_OK);
  auto cb = [wg, refused, pid](std::shared_ptr<PaxosMsg> msg) -> int {
    if (!IsValidMsg(msg.get()) || msg->type_ != kMsgType_CHOSEN_RSP || msg->errcode_ != kErrCode_OK) {
      int ret = (IsValidMsg(msg.get()) && msg->errcode_ != kErrCode_OK) ? int(msg->errcode_) : kErrCode_INVALID_MSG;
      LOG_WARN << "learner refused chosen value, pid:" << pid << ", from:" << (msg ? int(msg->from_) : -1)
               << ", ret:" << ErrCodeName(ret);

      int expected = kErrCode_OK;
      refused->compare_exchange_strong(expected, ret);
    }

    wg->Notify();
    return 0;
  };

  for (auto& conn : conns) {
    RpcReqData req{config_->timeout_ms_, cb, pm};
    if (conn->DoRpcRequest(std::move(req)) != kErrCode_OK) {
      LOG_WARN << "send chosen to learner(" << conn->GetAddr().id_ << ") failed, pid:" << pid;
    }
  }

  if (!wg->Wait(config_->timeout_ms_)) {
    LOG_WARN << "not all learners acked chosen value, pid:" << pid << ", answered:" << wg->Done()
             << ", learners:" << conns.size();
    return kErrCode_TIMEOUT;
  }

  return refused->load();
}

RoundResult Proposer::Propose(const std::string& val) {
  RoundResult result;

  if (!conn_) {
    result.ret_ = kErrCode_CONN_FAIL;
    return result;
  }

  if (index_ < 0) {
    result.ret_ = kErrCode_NOT_PROPOSER;
    return result;
  }

  std::unique_lock<std::mutex> l(round_lock_, std::try_to_lock);
  if (!l.owns_lock()) {
    result.ret_ = kErrCode_WORKING_IN_PROPGRESS;
    return result;
  }

  auto max_retry = config_->max_prepare_retry_;
  if (max_retry == 0) {
    LOG_WARN << "proposer(" << config_->local_.id_ << ") retries prepare without bound, "
             << "the round may never end under contention";
  }

  auto start = GetCurrTimeUS();
  Backoff backoff(Backoff::Params{config_->backoff_init_ms_, config_->backoff_max_ms_, config_->backoff_factor_});

  for (uint32_t i = 0; max_retry == 0 || i < max_retry; i++) {
    if (i > 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(backoff()));
    }

    uint64_t pid = kInvalidProposalId;
    {
      std::lock_guard<std::mutex> l2(ig_lock_);
      pid = ig_.GetAndInc();
    }

    result.attempts_ = i + 1;
    result.pid_ = pid;

    std::string chosen = val;
    auto ret = doPrepare(pid, &chosen);
    if (ret == kErrCode_OOM) {
      result.ret_ = ret;
      return result;
    }

    if (ret != kErrCode_OK) {
      continue;
    }

    ret = doAccept(pid, chosen);
    if (ret != kErrCode_OK) {
      result.ret_ = (ret == kErrCode_OOM) ? ret : kErrCode_ACCEPT_NOT_QUORUM;
      return result;
    }

    ret = doChosen(pid, chosen);
    if (ret != kErrCode_OK) {
      // the value is chosen anyway, learners may catch up later.
      LOG_WARN << "proposer(" << config_->local_.id_ << ") learn phase incomplete, pid:" << pid
               << ", ret:" << ErrCodeName(ret);
    }

    result.ret_ = kErrCode_OK;
    result.value_ = std::move(chosen);

    LOG_INFO << "proposer(" << config_->local_.id_ << ") value chosen, pid:" << pid
             << ", attempts:" << result.attempts_ << ", cost:" << (GetCurrTimeUS() - start) << "us";
    return result;
  }

  LOG_ERR << "proposer(" << config_->local_.id_ << ") gave up after " << result.attempts_
          << " prepare attempts, last pid:" << result.pid_;

  result.ret_ = kErrCode_PREPARE_NOT_QUORUM;
  return result;
}

std::future<RoundResult> Proposer::ProposeAsync(const std::string& val) {
  return std::async(std::launch::async, [this, val]() { return Propose(val); });
}

}  // namespace synod
