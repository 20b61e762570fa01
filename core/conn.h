#ifndef __SYNOD_CONN_H_
#define __SYNOD_CONN_H_

#include <atomic>
#include <string>
#include <vector>
#include <memory>
#include <functional>

#include "ptype.h"
#include "config.h"

namespace synod {

using ResponseCallback = std::function<int(std::shared_ptr<PaxosMsg>)>;
using RequestHandler = std::function<int(std::shared_ptr<PaxosMsg> ptr, ResponseCallback cb)>;

struct RpcReqData {
  uint32_t timeout_ms_;
  ResponseCallback cb_;
  std::shared_ptr<PaxosMsg> data_;
};

// conn is a connection abstraction to an acceptor or a learner.
// real connection can be created on top of tcp or udp or even in-process queue.
class Conn {
 public:
  explicit Conn(AddrInfo addr) : addr_(std::move(addr)) {}
  virtual ~Conn() {}

  const AddrInfo& GetAddr() const { return addr_; }

  // DoRpcRequest performs an *ASYNCHRONOUS* rpc request to the connected node.
  // the callback may be invoked from another thread, or never if the request
  // or its response is lost.
  virtual int DoRpcRequest(RpcReqData req) = 0;

 private:
  Conn(const Conn&) = delete;
  Conn& operator=(const Conn&) = delete;

 protected:
  AddrInfo addr_;
};

// InProcConn hands a private copy of every request to the mailbox of a node
// living in the same process.
class InProcConn : public Conn {
 public:
  InProcConn(AddrInfo addr, RequestHandler handler) : Conn(std::move(addr)), handler_(std::move(handler)) {}

  int DoRpcRequest(RpcReqData req) override;

 private:
  std::atomic<uint64_t> reqid_{1};
  RequestHandler handler_;
};

using ConnCreator = std::function<std::unique_ptr<Conn>(const AddrInfo&)>;

class ConnMng {
 public:
  explicit ConnMng(std::shared_ptr<Configure> config) : config_(std::move(config)) {}

  // create one conn per acceptor and per learner.
  // returns number of conn created, or a negative error code.
  int CreateConn();

  void SetConnCreator(ConnCreator creator) { conn_creator_ = std::move(creator); }

  std::vector<std::unique_ptr<Conn>>& GetAcceptorConn() { return acceptor_conn_; }
  std::vector<std::unique_ptr<Conn>>& GetLearnerConn() { return learner_conn_; }

 private:
  ConnMng(const ConnMng&) = delete;
  ConnMng& operator=(const ConnMng&) = delete;

  ConnCreator conn_creator_;
  std::shared_ptr<Configure> config_;
  std::vector<std::unique_ptr<Conn>> acceptor_conn_;
  std::vector<std::unique_ptr<Conn>> learner_conn_;
};

}  // namespace synod

#endif
