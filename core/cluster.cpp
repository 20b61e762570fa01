#include "cluster.h"

#include "logger.h"

namespace synod {

std::unique_ptr<Cluster> Cluster::NewCluster(uint32_t num_acceptor, uint32_t num_learner) {
  return NewCluster(num_acceptor, num_learner, Configure());
}

std::unique_ptr<Cluster> Cluster::NewCluster(uint32_t num_acceptor, uint32_t num_learner, const Configure& tmpl) {
  if (num_acceptor == 0) {
    LOG_ERR << "a cluster needs at least one acceptor";
    return NULL;
  }

  std::unique_ptr<Cluster> cluster(new Cluster(tmpl, num_acceptor, num_learner));
  if (cluster->start() != kErrCode_OK) {
    return NULL;
  }

  return cluster;
}

Cluster::Cluster(const Configure& tmpl, uint32_t num_acceptor, uint32_t num_learner) : tmpl_(tmpl) {
  tmpl_.total_acceptor_ = num_acceptor;
  tmpl_.peer_.clear();
  tmpl_.learner_.clear();

  for (auto i = 0u; i < num_acceptor + num_learner; i++) {
    AddrInfo addr{int(i), kAddrType_INPROC, "inproc://node-" + std::to_string(i)};
    auto& list = (i < num_acceptor) ? tmpl_.peer_ : tmpl_.learner_;
    list.push_back(std::move(addr));
  }

  selector_ = [](const Cluster& c, uint64_t round) { return int(round % c.GetAcceptorCount()); };
}

Cluster::~Cluster() { stop(); }

std::shared_ptr<Configure> Cluster::makeNodeConfig(int id) const {
  auto config = std::make_shared<Configure>(tmpl_);
  if (id < int(tmpl_.peer_.size())) {
    config->local_ = tmpl_.peer_[id];
  } else {
    config->local_ = tmpl_.learner_[id - tmpl_.peer_.size()];
  }
  return config;
}

int Cluster::deliver(int to, std::shared_ptr<PaxosMsg> msg, ResponseCallback cb) {
  if (to >= 0 && to < int(nodes_.size())) {
    return nodes_[to]->HandleMsg(std::move(msg), std::move(cb));
  }

  auto learner = GetLearner(to);
  if (learner == NULL) {
    return kErrCode_NODE_NOT_EXIST;
  }

  return learner->AddMsg(std::move(msg), std::move(cb));
}

std::unique_ptr<Conn> Cluster::createConn(const AddrInfo& addr) {
  auto to = addr.id_;
  auto handler = [this, to](std::shared_ptr<PaxosMsg> msg, ResponseCallback cb) {
    return deliver(to, std::move(msg), std::move(cb));
  };

  return std::unique_ptr<Conn>(new InProcConn(addr, std::move(handler)));
}

int Cluster::start() {
  auto ret = CheckConfig(tmpl_);
  if (ret != kErrCode_OK) {
    LOG_ERR << "invalid cluster config, ret:" << ErrCodeName(ret);
    return ret;
  }

  for (auto i = 0u; i < tmpl_.peer_.size(); i++) {
    auto config = makeNodeConfig(int(i));
    std::unique_ptr<Node> node(new Node(config));

    auto mng = std::make_shared<ConnMng>(config);
    auto from = config->local_.id_;
    mng->SetConnCreator([this](const AddrInfo& addr) { return createConn(addr); });

    ret = mng->CreateConn();
    if (ret < 0) {
      LOG_ERR << "create conn for node(" << from << ") failed, ret:" << ErrCodeName(ret);
      return ret;
    }

    node->SetStateStore(CreateStateStore(*config));
    node->SetConnMng(std::move(mng));
    nodes_.push_back(std::move(node));
  }

  for (auto i = 0u; i < tmpl_.learner_.size(); i++) {
    auto config = makeNodeConfig(int(tmpl_.peer_.size() + i));
    learners_.push_back(std::unique_ptr<Learner>(new Learner(config)));
  }

  for (auto& node : nodes_) {
    ret = node->Start();
    if (ret != kErrCode_OK) return ret;
  }

  for (auto& learner : learners_) {
    ret = learner->StartWorker();
    if (ret != kErrCode_OK) return ret;
  }

  LOG_INFO << "cluster started, acceptors:" << nodes_.size() << ", learners:" << learners_.size()
           << ", quorum:" << GetQuorumSize();
  return kErrCode_OK;
}

void Cluster::stop() {
  for (auto& node : nodes_) {
    node->Stop();
  }

  for (auto& learner : learners_) {
    learner->StopWorker();
  }
}

bool Cluster::IsLearner(int id) const {
  return id >= int(nodes_.size()) && id < int(nodes_.size() + learners_.size());
}

Node* Cluster::GetNode(int id) {
  if (!IsAcceptor(id)) return NULL;
  return nodes_[id].get();
}

Learner* Cluster::GetLearner(int id) {
  if (!IsLearner(id)) return NULL;
  return learners_[id - nodes_.size()].get();
}

int Cluster::SetNodeOnline(int id, bool online) {
  auto node = GetNode(id);
  if (node == NULL) return kErrCode_NODE_NOT_EXIST;

  node->SetOnline(online);
  LOG_INFO << "node(" << id << ") is " << (online ? "online" : "offline");
  return kErrCode_OK;
}

void Cluster::SetProposerSelector(ProposerSelector selector) {
  std::lock_guard<std::mutex> l(mutex_);
  selector_ = std::move(selector);
}

bool Cluster::GetDecision(uint64_t* pid, std::string* value) const {
  std::lock_guard<std::mutex> l(mutex_);
  if (!decided_) return false;

  if (pid) *pid = decision_pid_;
  if (value) *value = decision_;
  return true;
}

uint64_t Cluster::GetRoundCount() const {
  std::lock_guard<std::mutex> l(mutex_);
  return round_;
}

RoundResult Cluster::RunRound(const std::string& value) {
  ProposerSelector selector;
  uint64_t round = 0;
  {
    std::lock_guard<std::mutex> l(mutex_);
    selector = selector_;
    round = round_;
  }

  return RunRound(selector(*this, round), value);
}

RoundResult Cluster::RunRound(int proposer_id, const std::string& value) {
  RoundResult result;

  auto node = GetNode(proposer_id);
  if (node == NULL) {
    LOG_WARN << "node(" << proposer_id << ") can not act as proposer"
             << (IsLearner(proposer_id) ? ", it is a learner" : ", no such node");
    result.ret_ = IsLearner(proposer_id) ? kErrCode_NOT_PROPOSER : kErrCode_NODE_NOT_EXIST;
    return result;
  }

  {
    std::lock_guard<std::mutex> l(mutex_);
    round_++;
  }

  result = node->Propose(value);
  if (!result.Committed()) {
    LOG_INFO << "round by node(" << proposer_id << ") not committed, ret:" << ErrCodeName(result.ret_)
             << ", attempts:" << result.attempts_;
    return result;
  }

  std::lock_guard<std::mutex> l(mutex_);
  if (!decided_) {
    decided_ = true;
    decision_pid_ = result.pid_;
    decision_ = result.value_;
  } else if (decision_ != result.value_) {
    LOG_ERR << "agreement violated, decision pid:" << decision_pid_ << ", new pid:" << result.pid_
            << ", proposer:" << proposer_id;
    result.ret_ = kErrCode_AGREEMENT_VIOLATED;
  }

  return result;
}

}  // namespace synod
