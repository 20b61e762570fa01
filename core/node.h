#ifndef __SYNOD_NODE_H_
#define __SYNOD_NODE_H_

#include <atomic>
#include <memory>
#include <string>

#include "conn.h"
#include "plog.h"
#include "ptype.h"
#include "config.h"
#include "acceptor.h"
#include "proposer.h"

namespace synod {

// Node is an acceptor-capable participant: it answers prepare/accept requests
// as an acceptor, and drives rounds as a proposer when asked to.
class Node {
 public:
  explicit Node(std::shared_ptr<Configure> config);
  ~Node();

  int Start();
  int Stop();

  void SetConnMng(std::shared_ptr<ConnMng> mng);

  // must be called before Start().
  void SetStateStore(std::unique_ptr<StateStore> store) { acceptor_.SetStateStore(std::move(store)); }

  RoundResult Propose(const std::string& value) { return proposer_.Propose(value); }

  // deliver a request to the acceptor of this node.
  // an offline node drops the request silently, no response will ever be sent.
  int HandleMsg(std::shared_ptr<PaxosMsg> msg, ResponseCallback cb);

  void SetOnline(bool online) { online_.store(online); }
  bool IsOnline() const { return online_.load(); }

  int GetId() const { return config_->local_.id_; }

  Acceptor& GetAcceptor() { return acceptor_; }
  Proposer& GetProposer() { return proposer_; }

 private:
  Node(const Node&) = delete;
  Node& operator=(const Node&) = delete;

  bool started_{false};
  std::atomic<bool> online_{true};

  // these most basic info should come first.
  std::shared_ptr<Configure> config_;
  std::shared_ptr<ConnMng> conn_mng_;

  // those use basic info comes after.
  Acceptor acceptor_;
  Proposer proposer_;
};

}  // namespace synod

#endif
