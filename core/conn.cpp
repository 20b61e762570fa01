#include "conn.h"

#include "logger.h"

namespace synod {

int InProcConn::DoRpcRequest(RpcReqData req) {
  if (!req.data_ || !handler_) {
    return kErrCode_CONN_FAIL;
  }

  auto msg = CloneProposalMsg(*req.data_);
  if (!msg) {
    return kErrCode_OOM;
  }

  msg->reqid_ = reqid_.fetch_add(1);

  auto ret = handler_(std::move(msg), std::move(req.cb_));
  if (ret != kErrCode_OK) {
    LOG_DEBUG << "deliver msg to node(" << addr_.id_ << ") failed, ret:" << ret;
    return kErrCode_CONN_FAIL;
  }

  return kErrCode_OK;
}

int ConnMng::CreateConn() {
  if (!conn_creator_) {
    return kErrCode_CONN_FAIL;
  }

  acceptor_conn_.clear();
  learner_conn_.clear();

  for (const auto& addr : config_->peer_) {
    auto conn = conn_creator_(addr);
    if (!conn) {
      LOG_ERR << "create conn to acceptor failed, id:" << addr.id_ << ", addr:" << addr.addr_;
      return kErrCode_CONN_FAIL;
    }
    acceptor_conn_.push_back(std::move(conn));
  }

  for (const auto& addr : config_->learner_) {
    auto conn = conn_creator_(addr);
    if (!conn) {
      LOG_ERR << "create conn to learner failed, id:" << addr.id_ << ", addr:" << addr.addr_;
      return kErrCode_CONN_FAIL;
    }
    learner_conn_.push_back(std::move(conn));
  }

  return int(acceptor_conn_.size() + learner_conn_.size());
}

}  // namespace synod
