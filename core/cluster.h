#ifndef __SYNOD_CLUSTER_H_
#define __SYNOD_CLUSTER_H_

#include <mutex>
#include <memory>
#include <string>
#include <vector>
#include <functional>

#include "node.h"
#include "ptype.h"
#include "config.h"
#include "learner.h"
#include "proposer.h"

namespace synod {

class Cluster;

// picks the proposer of the next round, returns a svr id.
using ProposerSelector = std::function<int(const Cluster& cluster, uint64_t round)>;

// Cluster owns a fixed roster of nodes living in the same process:
// acceptor-capable nodes get svr id 0..N-1, learner-only nodes N..N+M-1.
// the roster never changes during the life of a cluster.
class Cluster {
 public:
  // nodes are started before return, NULL if the roster is invalid.
  static std::unique_ptr<Cluster> NewCluster(uint32_t num_acceptor, uint32_t num_learner);

  // tmpl provides timeouts, retry and storage settings shared by all nodes.
  static std::unique_ptr<Cluster> NewCluster(uint32_t num_acceptor, uint32_t num_learner, const Configure& tmpl);

  ~Cluster();

  // run a round with proposer_id as proposer.
  RoundResult RunRound(int proposer_id, const std::string& value);

  // run a round with the proposer picked by the selector.
  RoundResult RunRound(const std::string& value);

  void SetProposerSelector(ProposerSelector selector);

  uint32_t GetQuorumSize() const { return QuorumSize(uint32_t(nodes_.size())); }
  uint32_t GetAcceptorCount() const { return uint32_t(nodes_.size()); }
  uint32_t GetLearnerCount() const { return uint32_t(learners_.size()); }

  bool IsAcceptor(int id) const { return id >= 0 && id < int(nodes_.size()); }
  bool IsLearner(int id) const;

  // NULL if id is not an acceptor-capable node.
  Node* GetNode(int id);
  // NULL if id is not a learner-only node.
  Learner* GetLearner(int id);

  // simulate a node which is not reachable, messages sent to it are lost.
  int SetNodeOnline(int id, bool online);

  // the first value committed by any round, false if none yet.
  bool GetDecision(uint64_t* pid, std::string* value) const;

  uint64_t GetRoundCount() const;

 private:
  Cluster(const Configure& tmpl, uint32_t num_acceptor, uint32_t num_learner);

  Cluster(const Cluster&) = delete;
  Cluster& operator=(const Cluster&) = delete;

  int start();
  void stop();

  std::shared_ptr<Configure> makeNodeConfig(int id) const;
  std::unique_ptr<Conn> createConn(const AddrInfo& addr);
  int deliver(int to, std::shared_ptr<PaxosMsg> msg, ResponseCallback cb);

 private:
  Configure tmpl_;

  std::vector<std::unique_ptr<Node>> nodes_;
  std::vector<std::unique_ptr<Learner>> learners_;

  mutable std::mutex mutex_;
  uint64_t round_{0};
  bool decided_{false};
  uint64_t decision_pid_{kInvalidProposalId};
  std::string decision_;
  ProposerSelector selector_;
};

}  // namespace synod

#endif
