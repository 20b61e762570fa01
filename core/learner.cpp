#include "learner.h"

#include "logger.h"

namespace synod {

Learner::Learner(std::shared_ptr<Configure> config)
    : config_(std::move(config)),
      wpool_([this](LearnRequest d) { return doHandleMsg(std::move(d)); }, "learner") {}

Learner::~Learner() { StopWorker(); }

int Learner::StartWorker() {
  if (wpool_.StartWorker(1, int(config_->worker_msg_queue_sz_))) {
    return kErrCode_WORKER_NOT_STARTED;
  }
  return kErrCode_OK;
}

int Learner::StopWorker() {
  wpool_.StopWorker();
  return kErrCode_OK;
}

int Learner::Learn(uint64_t pid, const std::string& value) {
  std::lock_guard<std::mutex> l(mutex_);

  if (pid == kInvalidProposalId) {
    return kErrCode_INVALID_MSG;
  }

  if (pid < chosen_pid_) {
    LOG_INFO << "learner(" << config_->local_.id_ << ") ignore stale chosen, pid:" << pid
             << ", learned:" << chosen_pid_;
    return kErrCode_STALE_PROPOSAL;
  }

  if (chosen_pid_ != kInvalidProposalId && chosen_value_ != value) {
    // a correct cluster never chooses two values.
    LOG_ERR << "learner(" << config_->local_.id_ << ") learned a different value, pid:" << pid
            << ", previous pid:" << chosen_pid_;
  }

  chosen_pid_ = pid;
  chosen_value_ = value;

  LOG_DEBUG << "learner(" << config_->local_.id_ << ") learned, pid:" << pid << ", vsz:" << value.size();
  return kErrCode_OK;
}

bool Learner::GetChosen(uint64_t* pid, std::string* value) const {
  std::lock_guard<std::mutex> l(mutex_);
  if (chosen_pid_ == kInvalidProposalId) return false;

  if (pid) *pid = chosen_pid_;
  if (value) *value = chosen_value_;
  return true;
}

int Learner::AddMsg(std::shared_ptr<PaxosMsg> msg, ResponseCallback cb) {
  if (!wpool_.IsRunning()) {
    return kErrCode_WORKER_NOT_STARTED;
  }

  LearnRequest req;
  req.cb_ = std::move(cb);
  req.msg_ = std::move(msg);

  if (wpool_.AddWork(0, std::move(req))) {
    return kErrCode_LEARNER_QUEUE_FULL;
  }

  return kErrCode_OK;
}

int Learner::doHandleMsg(LearnRequest req) {
  auto rsp = AllocProposalMsg(0);
  if (!rsp) return kErrCode_OOM;

  auto rpp = GetProposalFromMsg(rsp.get());
  rsp->from_ = uint32_t(config_->local_.id_);

  if (!IsValidMsg(req.msg_.get())) {
    rsp->type_ = kMsgType_INVALID_REQ;
    rsp->errcode_ = kErrCode_INVALID_MSG;
    req.cb_(std::move(rsp));
    return kErrCode_OK;
  }

  auto& msg = *req.msg_;
  auto pp = GetProposalFromMsg(req.msg_.get());

  rsp->reqid_ = msg.reqid_;
  rsp->version_ = msg.version_;
  rpp->pid_ = pp->pid_;
  rpp->term_ = pp->term_;
  rpp->proposer_ = pp->proposer_;

  if (msg.type_ == kMsgType_CHOSEN_REQ) {
    auto ret = Learn(pp->pid_, GetValueFromProposal(*pp));
    rsp->type_ = kMsgType_CHOSEN_RSP;
    rsp->errcode_ = ret;
    rpp->status_ = (ret == kErrCode_OK) ? kPaxosState_LEARNED : kPaxosState_REJECTED;
  } else {
    LOG_WARN << "learner(" << config_->local_.id_ << ") refuses " << MsgTypeName(msg.type_)
             << " from:" << msg.from_;
    rsp->type_ = kMsgType_INVALID_REQ;
    rsp->errcode_ = kErrCode_INVALID_MSG;
    rpp->status_ = kPaxosState_REJECTED;
  }

  req.cb_(std::move(rsp));
  return kErrCode_OK;
}

}  // namespace synod
