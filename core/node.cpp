#include "node.h"

#include "logger.h"

namespace synod {

Node::Node(std::shared_ptr<Configure> config)
    : config_(std::move(config)), acceptor_(config_), proposer_(config_) {}

Node::~Node() { Stop(); }

void Node::SetConnMng(std::shared_ptr<ConnMng> mng) {
  conn_mng_ = std::move(mng);
  proposer_.SetConnMng(conn_mng_);
}

int Node::Start() {
  if (started_) return kErrCode_OK;

  auto ret = acceptor_.StartWorker();
  if (ret != kErrCode_OK) {
    LOG_ERR << "node(" << GetId() << ") start acceptor failed, ret:" << ErrCodeName(ret);
    return ret;
  }

  // a restarted node must not reuse the ids it sent before, every prepare it
  // sent also went to its own acceptor.
  auto st = acceptor_.GetState();
  proposer_.SkipProposalId(st.promised_);

  started_ = true;
  return kErrCode_OK;
}

int Node::Stop() {
  if (!started_) return kErrCode_OK;

  started_ = false;
  return acceptor_.StopWorker();
}

int Node::HandleMsg(std::shared_ptr<PaxosMsg> msg, ResponseCallback cb) {
  if (!online_.load()) {
    LOG_DEBUG << "node(" << GetId() << ") is offline, drop " << MsgTypeName(msg->type_);
    return kErrCode_OK;
  }

  return acceptor_.AddMsg(std::move(msg), std::move(cb));
}

}  // namespace synod
