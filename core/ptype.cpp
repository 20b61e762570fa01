#include "ptype.h"

#include <string.h>

namespace synod {

std::shared_ptr<PaxosMsg> AllocProposalMsg(uint32_t value_size) {
  // value_size == 0 is permitted
  auto total_sz = PaxosMsgHeaderSz + ProposalHeaderSz + value_size;
  auto rp = reinterpret_cast<PaxosMsg*>(malloc(total_sz));
  if (rp == NULL) return NULL;

  memset(rp, 0, total_sz);

  auto pp = reinterpret_cast<Proposal*>(rp->data_);
  pp->size_ = value_size;

  rp->magic_ = kPaxosMsgMagic;
  rp->size_ = static_cast<uint32_t>(ProposalHeaderSz + value_size);

  std::shared_ptr<PaxosMsg> p(rp, free);
  return p;
}

std::shared_ptr<PaxosMsg> AllocProposalMsg(uint32_t type, const std::string& value) {
  auto pm = AllocProposalMsg(uint32_t(value.size()));
  if (!pm) return NULL;

  pm->type_ = type;
  memcpy(GetProposalFromMsg(pm.get())->data_, value.data(), value.size());
  return pm;
}

std::shared_ptr<PaxosMsg> CloneProposalMsg(const PaxosMsg& pm) {
  auto pp = reinterpret_cast<const Proposal*>(pm.data_);
  auto value_size = pp->size_;

  auto rp = AllocProposalMsg(value_size);
  if (!rp) return NULL;

  memcpy(rp.get(), &pm, PaxosMsgHeaderSz + ProposalHeaderSz + value_size);
  return rp;
}

const char* MsgTypeName(uint32_t type) {
  switch (type) {
    case kMsgType_PREPARE_REQ:
      return "PREPARE_REQ";
    case kMsgType_PREPARE_RSP:
      return "PREPARE_RSP";
    case kMsgType_ACCEPT_REQ:
      return "ACCEPT_REQ";
    case kMsgType_ACCEPT_RSP:
      return "ACCEPT_RSP";
    case kMsgType_CHOSEN_REQ:
      return "CHOSEN_REQ";
    case kMsgType_CHOSEN_RSP:
      return "CHOSEN_RSP";
    case kMsgType_INVALID_REQ:
      return "INVALID_REQ";
    default:
      return "INVALID";
  }
}

const char* ErrCodeName(int errcode) {
  switch (errcode) {
    case kErrCode_OK:
      return "OK";
    case kErrCode_OOM:
      return "OOM";
    case kErrCode_TIMEOUT:
      return "TIMEOUT";
    case kErrCode_PREPARE_NOT_QUORUM:
      return "PREPARE_NOT_QUORUM";
    case kErrCode_ACCEPT_NOT_QUORUM:
      return "ACCEPT_NOT_QUORUM";
    case kErrCode_CONN_FAIL:
      return "CONN_FAIL";
    case kErrCode_PREPARE_REJECTED:
      return "PREPARE_REJECTED";
    case kErrCode_ACCEPT_REJECTED:
      return "ACCEPT_REJECTED";
    case kErrCode_WORKING_IN_PROPGRESS:
      return "WORKING_IN_PROPGRESS";
    case kErrCode_WORKER_NOT_STARTED:
      return "WORKER_NOT_STARTED";
    case kErrCode_ACCEPTOR_QUEUE_FULL:
      return "ACCEPTOR_QUEUE_FULL";
    case kErrCode_LEARNER_QUEUE_FULL:
      return "LEARNER_QUEUE_FULL";
    case kErrCode_WRITE_PLOG_FAIL:
      return "WRITE_PLOG_FAIL";
    case kErrCode_LOAD_PLOG_FAIL:
      return "LOAD_PLOG_FAIL";
    case kErrCode_INVALID_PLOG_DATA:
      return "INVALID_PLOG_DATA";
    case kErrCode_INVALID_MSG:
      return "INVALID_MSG";
    case kErrCode_INVALID_CONFIG:
      return "INVALID_CONFIG";
    case kErrCode_CONFIG_NOT_EXIST:
      return "CONFIG_NOT_EXIST";
    case kErrCode_NOT_PROPOSER:
      return "NOT_PROPOSER";
    case kErrCode_NODE_NOT_EXIST:
      return "NODE_NOT_EXIST";
    case kErrCode_STALE_PROPOSAL:
      return "STALE_PROPOSAL";
    case kErrCode_AGREEMENT_VIOLATED:
      return "AGREEMENT_VIOLATED";
    default:
      return "UNKNOWN";
  }
}

}  // namespace synod
