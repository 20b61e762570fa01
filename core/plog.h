#ifndef __SYNOD_PLOG_H_
#define __SYNOD_PLOG_H_

#include <mutex>
#include <memory>
#include <string>
#include <stddef.h>
#include <stdint.h>

#include "ptype.h"
#include "config.h"

namespace synod {

// durable state of an acceptor.
// accepted_ and value_ are always updated together.
struct AcceptorState {
  uint64_t promised_{kInvalidProposalId};
  uint64_t accepted_{kInvalidProposalId};
  std::string value_;

  bool HasAccepted() const { return accepted_ != kInvalidProposalId; }
};

inline bool operator==(const AcceptorState& l, const AcceptorState& r) {
  return l.promised_ == r.promised_ && l.accepted_ == r.accepted_ && l.value_ == r.value_;
}

// on-disk header of a persisted acceptor state, followed by the value.
struct PlogStateRaw {
  uint32_t magic_;
  uint32_t version_;
  uint64_t promised_;
  uint64_t accepted_;
  uint32_t size_;
  uint32_t checksum_;  // over header and value, computed with checksum_ = 0
  uint8_t data_[1];  // struct hack
} __attribute__((packed, aligned(1)));

constexpr auto PlogStateHeaderSz = offsetof(PlogStateRaw, data_);

// StateStore persists the state of one acceptor.
// Save() must be durable before it returns, an acceptor answers a request
// only after its new state has been saved.
class StateStore {
 public:
  virtual ~StateStore() {}

  // kErrCode_OK with a default state if nothing has been saved yet.
  virtual int Load(AcceptorState& state) = 0;
  virtual int Save(const AcceptorState& state) = 0;
};

class MemStateStore : public StateStore {
 public:
  int Load(AcceptorState& state) override;
  int Save(const AcceptorState& state) override;

 private:
  std::mutex mutex_;
  AcceptorState state_;
};

// one file per acceptor: <dir>/acceptor_<svrid>.plog
class FileStateStore : public StateStore {
 public:
  FileStateStore(std::string dir, int svr_id);

  int Load(AcceptorState& state) override;
  int Save(const AcceptorState& state) override;

  const std::string& GetPath() const { return path_; }

 private:
  std::string path_;
};

std::unique_ptr<StateStore> CreateStateStore(const Configure& config);

uint32_t PlogChecksum(const uint8_t* data, size_t sz);

}  // namespace synod

#endif
