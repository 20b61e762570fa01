#include "gtest/gtest.h"

#include <set>
#include <string>
#include <thread>
#include <chrono>
#include <future>
#include <random>
#include <vector>
#include <stdlib.h>
#include <unistd.h>

#include "logger.h"
#include "time.hpp"
#include "cluster.h"

using namespace synod;

static Configure MakeTemplate() {
  Configure tmpl;
  tmpl.timeout_ms_ = 1000;
  tmpl.max_prepare_retry_ = 20;
  tmpl.backoff_init_ms_ = 1;
  tmpl.backoff_max_ms_ = 16;
  return tmpl;
}

// accept messages are asynchronous, acceptors outside the quorum catch up later.
static bool WaitAccepted(Cluster& cluster, uint32_t count, const std::string& value, uint64_t timeout_ms = 2000) {
  auto deadline = GetCurrTimeMS() + timeout_ms;
  while (GetCurrTimeMS() < deadline) {
    uint32_t n = 0;
    for (auto i = 0u; i < cluster.GetAcceptorCount(); ++i) {
      auto st = cluster.GetNode(int(i))->GetAcceptor().GetState();
      if (st.HasAccepted() && st.value_ == value) n++;
    }
    if (n >= count) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  return false;
}

TEST(cluster_test, quorum) {
  Logger::setOutput([](const char*, int) {});

  std::vector<std::pair<uint32_t, uint32_t>> cases = {
      {1, 1}, {2, 2}, {3, 2}, {4, 3}, {5, 3}, {7, 4}, {100, 51},
  };

  for (auto& c : cases) {
    ASSERT_EQ(c.second, QuorumSize(c.first));

    auto cluster = Cluster::NewCluster(c.first, 0, MakeTemplate());
    ASSERT_TRUE(cluster != nullptr);
    ASSERT_EQ(c.second, cluster->GetQuorumSize());
    ASSERT_EQ(c.first, cluster->GetAcceptorCount());
  }

  ASSERT_TRUE(Cluster::NewCluster(0, 1) == nullptr);

  Logger::resetOutput();
}

TEST(cluster_test, singleround) {
  auto cluster = Cluster::NewCluster(5, 0, MakeTemplate());
  ASSERT_TRUE(cluster != nullptr);

  ASSERT_FALSE(cluster->GetDecision(NULL, NULL));

  auto r = cluster->RunRound(0, "42");
  ASSERT_TRUE(r.Committed());
  ASSERT_EQ("42", r.value_);
  ASSERT_EQ(1u, r.pid_);
  ASSERT_EQ(1u, r.attempts_);
  ASSERT_EQ(1u, cluster->GetRoundCount());

  uint64_t pid = 0;
  std::string value;
  ASSERT_TRUE(cluster->GetDecision(&pid, &value));
  ASSERT_EQ(1u, pid);
  ASSERT_EQ("42", value);

  ASSERT_TRUE(WaitAccepted(*cluster, 5, "42"));
}

TEST(cluster_test, chosenvaluesticks) {
  Logger::setOutput([](const char*, int) {});

  auto cluster = Cluster::NewCluster(5, 0, MakeTemplate());
  ASSERT_TRUE(cluster != nullptr);

  auto r = cluster->RunRound(0, "10");
  ASSERT_TRUE(r.Committed());
  ASSERT_EQ(1u, r.pid_);

  // a later proposer must discover and commit the same value.
  r = cluster->RunRound(1, "20");
  ASSERT_TRUE(r.Committed());
  ASSERT_EQ("10", r.value_);
  ASSERT_GT(r.pid_, 1u);

  for (int round = 0; round < 6; ++round) {
    r = cluster->RunRound("v" + std::to_string(round));
    ASSERT_TRUE(r.Committed());
    ASSERT_EQ("10", r.value_);
  }
  ASSERT_EQ(8u, cluster->GetRoundCount());

  std::string value;
  ASSERT_TRUE(cluster->GetDecision(NULL, &value));
  ASSERT_EQ("10", value);

  Logger::resetOutput();
}

TEST(cluster_test, learner) {
  Logger::setOutput([](const char*, int) {});

  auto cluster = Cluster::NewCluster(3, 2, MakeTemplate());
  ASSERT_TRUE(cluster != nullptr);
  ASSERT_EQ(2u, cluster->GetLearnerCount());

  ASSERT_TRUE(cluster->IsAcceptor(2));
  ASSERT_FALSE(cluster->IsLearner(2));
  ASSERT_TRUE(cluster->IsLearner(3));
  ASSERT_TRUE(cluster->IsLearner(4));
  ASSERT_FALSE(cluster->IsLearner(5));

  // a learner never proposes
  auto r = cluster->RunRound(3, "x");
  ASSERT_EQ(kErrCode_NOT_PROPOSER, r.ret_);
  ASSERT_TRUE(cluster->GetNode(3) == NULL);
  ASSERT_TRUE(cluster->GetLearner(2) == NULL);

  r = cluster->RunRound(9, "x");
  ASSERT_EQ(kErrCode_NODE_NOT_EXIST, r.ret_);
  ASSERT_EQ(0u, cluster->GetRoundCount());
  ASSERT_EQ(kErrCode_NODE_NOT_EXIST, cluster->SetNodeOnline(4, false));

  // nor answers a prepare
  auto learner = cluster->GetLearner(3);
  ASSERT_TRUE(learner != NULL);

  auto pms = std::make_shared<std::promise<std::shared_ptr<PaxosMsg>>>();
  auto m = AllocProposalMsg(kMsgType_PREPARE_REQ, "");
  GetProposalFromMsg(m.get())->pid_ = 5;
  ASSERT_EQ(kErrCode_OK, learner->AddMsg(m, [pms](std::shared_ptr<PaxosMsg> rsp) {
    pms->set_value(std::move(rsp));
    return 0;
  }));
  auto rsp = pms->get_future().get();
  ASSERT_EQ(uint32_t(kMsgType_INVALID_REQ), rsp->type_);

  r = cluster->RunRound(2, "learned");
  ASSERT_TRUE(r.Committed());

  for (int id = 3; id < 5; ++id) {
    uint64_t pid = 0;
    std::string value;
    ASSERT_TRUE(cluster->GetLearner(id)->GetChosen(&pid, &value));
    ASSERT_EQ(r.pid_, pid);
    ASSERT_EQ("learned", value);
  }

  Logger::resetOutput();
}

TEST(cluster_test, offline) {
  Logger::setOutput([](const char*, int) {});

  auto tmpl = MakeTemplate();
  tmpl.timeout_ms_ = 100;
  tmpl.max_prepare_retry_ = 2;

  auto cluster = Cluster::NewCluster(5, 0, tmpl);
  ASSERT_TRUE(cluster != nullptr);

  ASSERT_EQ(kErrCode_OK, cluster->SetNodeOnline(3, false));
  ASSERT_EQ(kErrCode_OK, cluster->SetNodeOnline(4, false));
  ASSERT_FALSE(cluster->GetNode(4)->IsOnline());

  auto r = cluster->RunRound(0, "majority");
  ASSERT_TRUE(r.Committed());
  ASSERT_FALSE(cluster->GetNode(3)->GetAcceptor().GetState().HasAccepted());

  ASSERT_EQ(kErrCode_OK, cluster->SetNodeOnline(2, false));
  r = cluster->RunRound(1, "minority");
  ASSERT_FALSE(r.Committed());
  ASSERT_EQ(kErrCode_PREPARE_NOT_QUORUM, r.ret_);
  ASSERT_EQ(2u, r.attempts_);

  // back online, the decided value survives
  for (int id = 2; id < 5; ++id) {
    ASSERT_EQ(kErrCode_OK, cluster->SetNodeOnline(id, true));
  }
  r = cluster->RunRound(4, "late");
  ASSERT_TRUE(r.Committed());
  ASSERT_EQ("majority", r.value_);
  ASSERT_TRUE(WaitAccepted(*cluster, 5, "majority"));

  Logger::resetOutput();
}

TEST(cluster_test, dueling) {
  Logger::setOutput([](const char*, int) {});

  auto cluster = Cluster::NewCluster(5, 1, MakeTemplate());
  ASSERT_TRUE(cluster != nullptr);

  std::vector<RoundResult> results(5);
  std::vector<std::thread> th;
  for (int i = 0; i < 5; ++i) {
    th.emplace_back([&cluster, &results, i]() { results[i] = cluster->RunRound(i, "value-" + std::to_string(i)); });
  }
  for (auto& t : th) t.join();

  std::set<std::string> chosen;
  for (auto& r : results) {
    ASSERT_NE(kErrCode_AGREEMENT_VIOLATED, r.ret_);
    if (r.Committed()) chosen.insert(r.value_);
  }
  ASSERT_LE(chosen.size(), 1u);

  // whatever happened, a quiet round settles on a single value.
  auto r = cluster->RunRound(0, "quiet");
  ASSERT_TRUE(r.Committed());
  if (!chosen.empty()) {
    ASSERT_EQ(*chosen.begin(), r.value_);
  }

  std::string value;
  ASSERT_TRUE(cluster->GetDecision(NULL, &value));
  ASSERT_EQ(r.value_, value);

  ASSERT_TRUE(cluster->GetLearner(5)->GetChosen(NULL, &value));
  ASSERT_EQ(r.value_, value);

  Logger::resetOutput();
}

TEST(cluster_test, selector) {
  Logger::setOutput([](const char*, int) {});

  auto cluster = Cluster::NewCluster(5, 0, MakeTemplate());
  ASSERT_TRUE(cluster != nullptr);

  std::vector<int> picked;
  std::mt19937 rng(20261019);
  cluster->SetProposerSelector([&picked, &rng](const Cluster& c, uint64_t round) {
    (void)round;
    int id = int(rng() % c.GetAcceptorCount());
    picked.push_back(id);
    return id;
  });

  std::string first;
  for (int i = 0; i < 10; ++i) {
    auto r = cluster->RunRound("r" + std::to_string(i));
    ASSERT_TRUE(r.Committed());
    if (i == 0) first = r.value_;
    ASSERT_EQ(first, r.value_);
  }
  ASSERT_EQ("r0", first);
  ASSERT_EQ(10u, picked.size());

  Logger::resetOutput();
}

TEST(cluster_test, filestorage) {
  Logger::setOutput([](const char*, int) {});

  char dir[] = "/tmp/synod_cluster_XXXXXX";
  ASSERT_TRUE(mkdtemp(dir) != NULL);

  auto tmpl = MakeTemplate();
  tmpl.storage_type_ = kStorageType_FILE;
  tmpl.local_storage_path_ = dir;

  {
    auto cluster = Cluster::NewCluster(3, 0, tmpl);
    ASSERT_TRUE(cluster != nullptr);
    auto r = cluster->RunRound(0, "persisted");
    ASSERT_TRUE(r.Committed());
    ASSERT_TRUE(WaitAccepted(*cluster, 3, "persisted"));
  }

  // a restarted cluster reloads acceptor state from disk
  {
    auto cluster = Cluster::NewCluster(3, 0, tmpl);
    ASSERT_TRUE(cluster != nullptr);
    ASSERT_EQ("persisted", cluster->GetNode(1)->GetAcceptor().GetState().value_);

    auto r = cluster->RunRound(2, "other");
    ASSERT_TRUE(r.Committed());
    ASSERT_EQ("persisted", r.value_);
  }

  for (int i = 0; i < 3; ++i) {
    FileStateStore fs(dir, i);
    unlink(fs.GetPath().c_str());
  }
  rmdir(dir);

  Logger::resetOutput();
}

TEST(cluster_test, restartnoidreuse) {
  Logger::setOutput([](const char*, int) {});

  char dir[] = "/tmp/synod_restart_XXXXXX";
  ASSERT_TRUE(mkdtemp(dir) != NULL);

  // state left by an earlier run: node 0 prepared pid 1, reached acceptor 0
  // and 1, and got "x" accepted on its own acceptor only.
  {
    AcceptorState st;
    st.promised_ = 1;
    ASSERT_EQ(kErrCode_OK, FileStateStore(dir, 1).Save(st));

    st.accepted_ = 1;
    st.value_ = "x";
    ASSERT_EQ(kErrCode_OK, FileStateStore(dir, 0).Save(st));
  }

  auto tmpl = MakeTemplate();
  tmpl.timeout_ms_ = 200;
  tmpl.storage_type_ = kStorageType_FILE;
  tmpl.local_storage_path_ = dir;

  auto cluster = Cluster::NewCluster(3, 0, tmpl);
  ASSERT_TRUE(cluster != nullptr);

  // ids sent before the restart are skipped
  ASSERT_GT(cluster->GetNode(0)->GetProposer().GetNextProposalId(), 1u);

  ASSERT_EQ(kErrCode_OK, cluster->SetNodeOnline(0, false));
  auto r = cluster->RunRound(0, "y");
  ASSERT_TRUE(r.Committed());
  ASSERT_EQ("y", r.value_);
  ASSERT_GT(r.pid_, 1u);
  ASSERT_TRUE(WaitAccepted(*cluster, 2, "y"));

  ASSERT_EQ(kErrCode_OK, cluster->SetNodeOnline(0, true));
  ASSERT_EQ(kErrCode_OK, cluster->SetNodeOnline(2, false));
  r = cluster->RunRound(1, "z");
  ASSERT_TRUE(r.Committed());
  ASSERT_EQ("y", r.value_);

  // a pid promised already can not be promised again
  ASSERT_EQ(kErrCode_PREPARE_REJECTED, cluster->GetNode(1)->GetAcceptor().Prepare(1).ret_);

  std::string value;
  ASSERT_TRUE(cluster->GetDecision(NULL, &value));
  ASSERT_EQ("y", value);

  cluster.reset();
  for (int i = 0; i < 3; ++i) {
    FileStateStore fs(dir, i);
    unlink(fs.GetPath().c_str());
  }
  rmdir(dir);

  Logger::resetOutput();
}
