#include "acceptor.h"

#include "logger.h"

namespace synod {

Acceptor::Acceptor(std::shared_ptr<Configure> config)
    : config_(std::move(config)),
      store_(new MemStateStore()),
      wpool_([this](PaxosRequest d) { return doHandleMsg(std::move(d)); }, "acceptor") {}

Acceptor::~Acceptor() { StopWorker(); }

int Acceptor::StartWorker() {
  if (wpool_.IsRunning()) return kErrCode_OK;

  {
    std::lock_guard<std::mutex> l(mutex_);
    AcceptorState st;
    auto ret = store_->Load(st);
    if (ret != kErrCode_OK) {
      LOG_ERR << "acceptor(" << config_->local_.id_ << ") load state failed, ret:" << ret;
      return ret;
    }

    state_ = std::move(st);
    LOG_INFO << "acceptor(" << config_->local_.id_ << ") started, promised:" << state_.promised_
             << ", accepted:" << state_.accepted_;
  }

  // one worker only, requests of the node are handled one at a time.
  if (wpool_.StartWorker(1, int(config_->worker_msg_queue_sz_))) {
    return kErrCode_WORKER_NOT_STARTED;
  }

  return kErrCode_OK;
}

int Acceptor::StopWorker() {
  wpool_.StopWorker();
  return kErrCode_OK;
}

AcceptorState Acceptor::GetState() const {
  std::lock_guard<std::mutex> l(mutex_);
  return state_;
}

int Acceptor::persist(const AcceptorState& state) {
  auto ret = store_->Save(state);
  if (ret != kErrCode_OK) {
    LOG_ERR << "acceptor(" << config_->local_.id_ << ") save state failed, ret:" << ret
            << ", promised:" << state.promised_ << ", accepted:" << state.accepted_;
    return kErrCode_WRITE_PLOG_FAIL;
  }

  state_ = state;
  return kErrCode_OK;
}

Vote Acceptor::reject(int reason) const {
  Vote v;
  v.ret_ = reason;
  v.promised_ = state_.promised_;
  return v;
}

Vote Acceptor::Prepare(uint64_t pid) {
  std::lock_guard<std::mutex> l(mutex_);

  if (pid == kInvalidProposalId) {
    return reject(kErrCode_INVALID_MSG);
  }

  // an id already promised may come from a proposer which restarted and
  // reuses its ids, it must not win a second promise.
  if (pid <= state_.promised_) {
    LOG_INFO << "acceptor(" << config_->local_.id_ << ") reject prepare, pid:" << pid
             << ", promised:" << state_.promised_;
    return reject(kErrCode_PREPARE_REJECTED);
  }

  AcceptorState st = state_;
  st.promised_ = pid;

  auto ret = persist(st);
  if (ret != kErrCode_OK) {
    return reject(ret);
  }

  Vote v;
  v.promised_ = state_.promised_;
  v.accepted_ = state_.accepted_;
  v.value_ = state_.value_;
  return v;
}

Vote Acceptor::Accept(uint64_t pid, const std::string& value) {
  std::lock_guard<std::mutex> l(mutex_);

  if (pid == kInvalidProposalId) {
    return reject(kErrCode_INVALID_MSG);
  }

  if (pid < state_.promised_) {
    LOG_INFO << "acceptor(" << config_->local_.id_ << ") reject accept, pid:" << pid
             << ", promised:" << state_.promised_;
    return reject(kErrCode_ACCEPT_REJECTED);
  }

  if (state_.accepted_ != pid || state_.value_ != value) {
    AcceptorState st;
    st.promised_ = pid;
    st.accepted_ = pid;
    st.value_ = value;

    auto ret = persist(st);
    if (ret != kErrCode_OK) {
      return reject(ret);
    }

    LOG_DEBUG << "acceptor(" << config_->local_.id_ << ") accepted, pid:" << pid
              << ", vsz:" << value.size();
  }

  Vote v;
  v.promised_ = state_.promised_;
  v.accepted_ = state_.accepted_;
  v.value_ = state_.value_;
  return v;
}

std::future<std::shared_ptr<PaxosMsg>> Acceptor::AddMsgAsync(std::shared_ptr<PaxosMsg> msg) {
  auto pms = std::make_shared<std::promise<std::shared_ptr<PaxosMsg>>>();
  auto cb = [pms](std::shared_ptr<PaxosMsg> m) mutable {
    pms->set_value(std::move(m));
    return 0;
  };

  auto ret = AddMsg(std::move(msg), cb);
  if (ret) {
    auto m = AllocProposalMsg(0);
    if (m) {
      m->errcode_ = ret;
      m->type_ = kMsgType_INVALID;
    }
    cb(std::move(m));
  }

  return pms->get_future();
}

int Acceptor::AddMsg(std::shared_ptr<PaxosMsg> msg, ResponseCallback cb) {
  if (!wpool_.IsRunning()) {
    return kErrCode_WORKER_NOT_STARTED;
  }

  PaxosRequest req;
  req.cb_ = std::move(cb);
  req.msg_ = std::move(msg);

  if (wpool_.AddWork(0, std::move(req))) {
    return kErrCode_ACCEPTOR_QUEUE_FULL;
  }

  return kErrCode_OK;
}

std::shared_ptr<PaxosMsg> Acceptor::makeRsp(const PaxosMsg& req, uint32_t type, const Vote& vote) const {
  auto rsp = AllocProposalMsg(type, vote.value_);
  if (!rsp) return NULL;

  auto reqpp = GetProposalFromMsg(&req);
  auto rpp = GetProposalFromMsg(rsp.get());

  rsp->from_ = uint32_t(config_->local_.id_);
  rsp->version_ = req.version_;
  rsp->reqid_ = req.reqid_;
  rsp->errcode_ = vote.ret_;

  rpp->pid_ = reqpp->pid_;
  rpp->term_ = reqpp->term_;
  rpp->proposer_ = reqpp->proposer_;
  rpp->promised_ = vote.promised_;
  rpp->accepted_ = vote.accepted_;

  if (!vote.Ok()) {
    rpp->status_ = kPaxosState_REJECTED;
  } else if (type == kMsgType_PREPARE_RSP) {
    rpp->status_ = kPaxosState_PROMISED;
  } else {
    rpp->status_ = kPaxosState_ACCEPTED;
  }

  return rsp;
}

int Acceptor::doHandleMsg(PaxosRequest req) {
  std::shared_ptr<PaxosMsg> rsp;

  if (!IsValidMsg(req.msg_.get())) {
    LOG_ERR << "acceptor(" << config_->local_.id_ << ") drop malformed msg";
    rsp = AllocProposalMsg(0);
    if (rsp) {
      rsp->type_ = kMsgType_INVALID_REQ;
      rsp->errcode_ = kErrCode_INVALID_MSG;
    }
  } else {
    auto& msg = *req.msg_;
    auto pp = GetProposalFromMsg(req.msg_.get());

    if (msg.type_ == kMsgType_PREPARE_REQ) {
      rsp = makeRsp(msg, kMsgType_PREPARE_RSP, Prepare(pp->pid_));
    } else if (msg.type_ == kMsgType_ACCEPT_REQ) {
      rsp = makeRsp(msg, kMsgType_ACCEPT_RSP, Accept(pp->pid_, GetValueFromProposal(*pp)));
    } else {
      LOG_WARN << "acceptor(" << config_->local_.id_ << ") got unexpected msg, type:"
               << MsgTypeName(msg.type_) << ", from:" << msg.from_;
      Vote v;
      v.ret_ = kErrCode_INVALID_MSG;
      rsp = makeRsp(msg, kMsgType_INVALID_REQ, v);
    }
  }

  if (!rsp) {
    LOG_ERR << "acceptor(" << config_->local_.id_ << ") alloc rsp failed";
    return kErrCode_OOM;
  }

  rsp->from_ = uint32_t(config_->local_.id_);
  req.cb_(std::move(rsp));
  return kErrCode_OK;
}

}  // namespace synod
