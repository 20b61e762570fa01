#ifndef __SYNOD_PTYPE_H_
#define __SYNOD_PTYPE_H_

#include <memory>
#include <string>
#include <cstddef>
#include <cstdint>
#include <stdlib.h>
#include <string.h>

namespace synod {

enum PaxosState {
  kPaxosState_PREPARED = 1,
  kPaxosState_PROMISED = 2,
  kPaxosState_ACCEPTED = 3,
  kPaxosState_REJECTED = 4,
  kPaxosState_CHOSEN = 5,
  kPaxosState_LEARNED = 6,
};

enum PaxosMsgType {
  kMsgType_INVALID = 0,
  kMsgType_PREPARE_REQ = 1,
  kMsgType_PREPARE_RSP = 2,
  kMsgType_ACCEPT_REQ = 3,
  kMsgType_ACCEPT_RSP = 4,
  kMsgType_CHOSEN_REQ = 5,
  kMsgType_CHOSEN_RSP = 6,
  kMsgType_INVALID_REQ = 7,
};

enum PaxosErrCode {
  kErrCode_OK = 0,
  kErrCode_OOM = -3001,
  kErrCode_TIMEOUT = -3002,
  kErrCode_PREPARE_NOT_QUORUM = -3003,
  kErrCode_ACCEPT_NOT_QUORUM = -3004,
  kErrCode_CONN_FAIL = -3005,
  kErrCode_PREPARE_REJECTED = -3006,
  kErrCode_ACCEPT_REJECTED = -3007,
  kErrCode_WORKING_IN_PROPGRESS = -3008,
  kErrCode_WORKER_NOT_STARTED = -3009,
  kErrCode_ACCEPTOR_QUEUE_FULL = -3010,
  kErrCode_LEARNER_QUEUE_FULL = -3011,
  kErrCode_WRITE_PLOG_FAIL = -3012,
  kErrCode_LOAD_PLOG_FAIL = -3013,
  kErrCode_INVALID_PLOG_DATA = -3014,
  kErrCode_INVALID_MSG = -3015,
  kErrCode_INVALID_CONFIG = -3016,
  kErrCode_CONFIG_NOT_EXIST = -3017,
  kErrCode_NOT_PROPOSER = -3018,
  kErrCode_NODE_NOT_EXIST = -3019,
  kErrCode_STALE_PROPOSAL = -3020,
  kErrCode_AGREEMENT_VIOLATED = -3021,
};

// proposal id 0 is never generated, it stands for "none".
constexpr uint64_t kInvalidProposalId = 0;

constexpr uint32_t kPaxosMsgMagic = 0x5e0dbeef;

inline uint32_t QuorumSize(uint32_t total) { return total / 2 + 1; }

struct Proposal {
  uint64_t pid_;       // proposal id of the request
  uint64_t term_;      // logical time of the proposer, used to drop late rsp
  uint64_t promised_;  // acceptor's highest promised id(rsp only)
  uint64_t accepted_;  // id of the value carried in data_, kInvalidProposalId if none
  uint32_t proposer_;  // svr id of the proposer
  uint32_t status_;

  uint32_t size_;    // sizeof value
  uint8_t data_[1];  // struct hack
} __attribute__((packed, aligned(1)));

struct PaxosMsg {
  uint32_t magic_;
  uint32_t size_;
  uint32_t type_;
  uint32_t version_;
  uint32_t from_;  // svr id
  int32_t errcode_;
  uint64_t reqid_;   // rpc id
  uint8_t data_[1];  // struct hack
} __attribute__((packed, aligned(1)));

constexpr auto PaxosMsgHeaderSz = offsetof(PaxosMsg, data_);
constexpr auto ProposalHeaderSz = offsetof(Proposal, data_);

std::shared_ptr<PaxosMsg> CloneProposalMsg(const PaxosMsg& pm);
std::shared_ptr<PaxosMsg> AllocProposalMsg(uint32_t value_size);
std::shared_ptr<PaxosMsg> AllocProposalMsg(uint32_t type, const std::string& value);

const char* MsgTypeName(uint32_t type);
const char* ErrCodeName(int errcode);

inline Proposal* GetProposalFromMsg(PaxosMsg* pm) {
  return reinterpret_cast<Proposal*>(pm->data_);
}

inline const Proposal* GetProposalFromMsg(const PaxosMsg* pm) {
  return reinterpret_cast<const Proposal*>(pm->data_);
}

inline std::string GetValueFromProposal(const Proposal& pp) {
  return std::string(reinterpret_cast<const char*>(pp.data_), pp.size_);
}

// a message is valid if the header and the body agree on the value size.
inline bool IsValidMsg(const PaxosMsg* pm) {
  if (pm == NULL || pm->magic_ != kPaxosMsgMagic) return false;
  return pm->size_ == ProposalHeaderSz + GetProposalFromMsg(pm)->size_;
}

}  // namespace synod

#endif
