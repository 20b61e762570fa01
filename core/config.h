#ifndef __SYNOD_CONFIGURE_H_
#define __SYNOD_CONFIGURE_H_

#include <string>
#include <vector>
#include <stdint.h>

namespace synod {

enum AddrType {
  kAddrType_INVALID = 0,
  kAddrType_INPROC = 1,  // in-process mailbox
};

enum StorageType {
  kStorageType_MEM = 0,
  kStorageType_FILE = 1,
};

struct AddrInfo {
  int id_;    // svr id
  int type_;  // see AddrType
  std::string addr_;
};

inline bool operator==(const AddrInfo& left, const AddrInfo& right) {
  if (&left == &right) return true;

  return (left.id_ == right.id_) && (left.type_ == right.type_) && (left.addr_ == right.addr_);
}

struct Configure {
  uint32_t timeout_ms_{100};  // max time to wait for responses of one phase.
  uint32_t total_acceptor_{3};

  // prepare attempts per round, 0 retries forever which may never return under contention.
  uint32_t max_prepare_retry_{8};
  uint32_t backoff_init_ms_{1};
  uint32_t backoff_max_ms_{32};
  uint32_t backoff_factor_{2};

  uint32_t worker_msg_queue_sz_{10000};
  uint32_t msg_version_{0};

  uint32_t storage_type_{kStorageType_MEM};
  std::string local_storage_path_;  // storage dir for kStorageType_FILE

  AddrInfo local_{0, kAddrType_INPROC, ""};
  std::vector<AddrInfo> peer_;     // acceptor-capable nodes, local included.
  std::vector<AddrInfo> learner_;  // learner-only nodes.
};

// returns index of svr id within peer_, -1 if it is not an acceptor.
int GetAcceptorIndex(const Configure& config, int svr_id);

int CheckConfig(const Configure& config);

// config file is made of "key = value" lines, '#' starts a comment.
// address lines are "local|peer|learner = <id> <addr>".
int InitConfigFromFile(const std::string& path, Configure& config);
int InitConfigFromString(const std::string& content, Configure& config);

}  // namespace synod

#endif
