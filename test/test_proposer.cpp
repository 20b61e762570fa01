#include "gtest/gtest.h"

#include <map>
#include <mutex>
#include <atomic>
#include <string>
#include <thread>
#include <chrono>
#include <future>

#include "logger.h"

#include "acceptor.h"
#include "learner.h"
#include "proposer.h"
#include "time.hpp"

using namespace synod;

static std::shared_ptr<Configure> MakeConfig(int id, int total_acceptor, int total_learner) {
  auto config = std::make_shared<Configure>();
  config->timeout_ms_ = 1000;
  config->total_acceptor_ = uint32_t(total_acceptor);
  config->max_prepare_retry_ = 3;
  config->backoff_init_ms_ = 1;
  config->backoff_max_ms_ = 4;
  config->local_ = {id, kAddrType_INPROC, "inproc://node-" + std::to_string(id)};
  for (int i = 0; i < total_acceptor; ++i) {
    config->peer_.push_back({i, kAddrType_INPROC, "inproc://node-" + std::to_string(i)});
  }
  for (int i = total_acceptor; i < total_acceptor + total_learner; ++i) {
    config->learner_.push_back({i, kAddrType_INPROC, "inproc://node-" + std::to_string(i)});
  }
  return config;
}

// PaxosEnv hosts three acceptors and one learner, the proposer runs on node 0.
// handlers_ may be overridden per node to drop or tamper with requests.
struct PaxosEnv {
  PaxosEnv() {
    config_ = MakeConfig(0, 3, 1);

    for (int i = 0; i < 3; ++i) {
      acceptor_.emplace_back(new Acceptor(MakeConfig(i, 3, 1)));
      EXPECT_EQ(kErrCode_OK, acceptor_.back()->StartWorker());

      auto acc = acceptor_.back().get();
      handlers_[i] = [acc](std::shared_ptr<PaxosMsg> m, ResponseCallback cb) {
        return acc->AddMsg(std::move(m), std::move(cb));
      };
    }

    learner_.reset(new Learner(MakeConfig(3, 3, 1)));
    EXPECT_EQ(kErrCode_OK, learner_->StartWorker());

    auto ln = learner_.get();
    handlers_[3] = [ln](std::shared_ptr<PaxosMsg> m, ResponseCallback cb) {
      return ln->AddMsg(std::move(m), std::move(cb));
    };

    proposer_.reset(new Proposer(config_));
  }

  // must be called after handlers_ are set.
  void Connect() {
    auto mng = std::make_shared<ConnMng>(config_);
    mng->SetConnCreator([this](const AddrInfo& addr) {
      auto handler = handlers_[addr.id_];
      return std::unique_ptr<Conn>(new InProcConn(addr, std::move(handler)));
    });
    ASSERT_EQ(4, mng->CreateConn());
    proposer_->SetConnMng(mng);
  }

  void Drop(int id) {
    handlers_[id] = [](std::shared_ptr<PaxosMsg>, ResponseCallback) { return kErrCode_CONN_FAIL; };
  }

  std::shared_ptr<Configure> config_;
  std::vector<std::unique_ptr<Acceptor>> acceptor_;
  std::unique_ptr<Learner> learner_;
  std::unique_ptr<Proposer> proposer_;
  std::map<int, RequestHandler> handlers_;
};

TEST(proposer_test, commit) {
  PaxosEnv env;
  env.Connect();

  ASSERT_EQ(1u, env.proposer_->GetNextProposalId());

  auto r = env.proposer_->Propose("hello");
  ASSERT_TRUE(r.Committed());
  ASSERT_EQ("hello", r.value_);
  ASSERT_EQ(1u, r.pid_);
  ASSERT_EQ(1u, r.attempts_);

  // ids advance by the number of acceptors
  ASSERT_EQ(4u, env.proposer_->GetNextProposalId());

  // a quorum accepted the value, the rest may still be processing.
  int accepted = 0;
  for (auto& acc : env.acceptor_) {
    auto st = acc->GetState();
    if (st.accepted_ == 1 && st.value_ == "hello") accepted++;
  }
  ASSERT_GE(accepted, 2);

  uint64_t pid = 0;
  std::string value;
  ASSERT_TRUE(env.learner_->GetChosen(&pid, &value));
  ASSERT_EQ(1u, pid);
  ASSERT_EQ("hello", value);

  // a chosen value stays chosen
  r = env.proposer_->Propose("world");
  ASSERT_TRUE(r.Committed());
  ASSERT_EQ("hello", r.value_);
  ASSERT_EQ(4u, r.pid_);
}

TEST(proposer_test, adoptvalue) {
  Logger::setOutput([](const char*, int) {});

  PaxosEnv env;
  env.Connect();

  // node 1 proposed "old" with pid 2 and reached acceptor 1 and 2 only.
  for (int i = 1; i < 3; ++i) {
    ASSERT_TRUE(env.acceptor_[i]->Prepare(2).Ok());
    ASSERT_TRUE(env.acceptor_[i]->Accept(2, "old").Ok());
  }

  auto r = env.proposer_->Propose("new");
  ASSERT_TRUE(r.Committed());
  ASSERT_EQ("old", r.value_);
  ASSERT_EQ(2u, r.attempts_);
  ASSERT_EQ(4u, r.pid_);

  std::string value;
  ASSERT_TRUE(env.learner_->GetChosen(NULL, &value));
  ASSERT_EQ("old", value);

  Logger::resetOutput();
}

TEST(proposer_test, minority) {
  Logger::setOutput([](const char*, int) {});

  PaxosEnv env;
  env.Drop(2);
  env.Connect();

  auto r = env.proposer_->Propose("v");
  ASSERT_TRUE(r.Committed());
  ASSERT_EQ("v", r.value_);
  ASSERT_FALSE(env.acceptor_[2]->GetState().HasAccepted());

  Logger::resetOutput();
}

TEST(proposer_test, noquorum) {
  Logger::setOutput([](const char*, int) {});

  PaxosEnv env;
  env.Drop(1);
  env.Drop(2);
  env.Connect();

  auto r = env.proposer_->Propose("v");
  ASSERT_EQ(kErrCode_PREPARE_NOT_QUORUM, r.ret_);
  ASSERT_EQ(env.config_->max_prepare_retry_, r.attempts_);
  ASSERT_FALSE(env.learner_->GetChosen(NULL, NULL));

  // nothing has been accepted anywhere
  for (auto& acc : env.acceptor_) {
    ASSERT_FALSE(acc->GetState().HasAccepted());
  }

  Logger::resetOutput();
}

TEST(proposer_test, acceptrejected) {
  Logger::setOutput([](const char*, int) {});

  PaxosEnv env;

  // a competing proposer sneaks in a higher prepare between the two phases.
  for (int i = 1; i < 3; ++i) {
    auto acc = env.acceptor_[i].get();
    env.handlers_[i] = [acc](std::shared_ptr<PaxosMsg> m, ResponseCallback cb) {
      if (m->type_ == kMsgType_ACCEPT_REQ) acc->Prepare(100);
      return acc->AddMsg(std::move(m), std::move(cb));
    };
  }
  env.Connect();

  auto r = env.proposer_->Propose("v");
  ASSERT_EQ(kErrCode_ACCEPT_NOT_QUORUM, r.ret_);
  ASSERT_FALSE(env.learner_->GetChosen(NULL, NULL));

  // next attempt starts above the competing promise
  ASSERT_GT(env.proposer_->GetNextProposalId(), 100u);

  Logger::resetOutput();
}

TEST(proposer_test, learnerasacceptor) {
  Logger::setOutput([](const char*, int) {});

  PaxosEnv env;

  // acceptor 1 and 2 are misconfigured to point to the learner, which
  // refuses to promise.
  auto ln = env.learner_.get();
  for (int i = 1; i < 3; ++i) {
    env.handlers_[i] = [ln](std::shared_ptr<PaxosMsg> m, ResponseCallback cb) {
      return ln->AddMsg(std::move(m), std::move(cb));
    };
  }
  env.Connect();

  auto r = env.proposer_->Propose("v");
  ASSERT_EQ(kErrCode_PREPARE_NOT_QUORUM, r.ret_);
  ASSERT_FALSE(env.acceptor_[0]->GetState().HasAccepted());
  ASSERT_FALSE(env.learner_->GetChosen(NULL, NULL));

  Logger::resetOutput();
}

TEST(proposer_test, roundinprogress) {
  PaxosEnv env;

  std::promise<void> entered;
  std::promise<void> gate;
  auto gate_ft = gate.get_future().share();
  auto once = std::make_shared<std::atomic<bool>>(false);

  auto acc = env.acceptor_[0].get();
  auto* entered_ptr = &entered;
  env.handlers_[0] = [acc, gate_ft, once, entered_ptr](std::shared_ptr<PaxosMsg> m, ResponseCallback cb) {
    if (!once->exchange(true)) {
      entered_ptr->set_value();
      gate_ft.wait();
    }
    return acc->AddMsg(std::move(m), std::move(cb));
  };
  env.Connect();

  auto ft = env.proposer_->ProposeAsync("first");
  entered.get_future().wait();

  auto r = env.proposer_->Propose("second");
  ASSERT_EQ(kErrCode_WORKING_IN_PROPGRESS, r.ret_);

  gate.set_value();
  r = ft.get();
  ASSERT_TRUE(r.Committed());
  ASSERT_EQ("first", r.value_);
}

TEST(proposer_test, notproposer) {
  auto config = MakeConfig(3, 3, 1);
  Proposer proposer(config);

  auto r = proposer.Propose("v");
  ASSERT_EQ(kErrCode_CONN_FAIL, r.ret_);

  auto mng = std::make_shared<ConnMng>(config);
  proposer.SetConnMng(mng);
  r = proposer.Propose("v");
  ASSERT_EQ(kErrCode_NOT_PROPOSER, r.ret_);
}

TEST(proposer_test, learnerrefuses) {
  std::mutex mu;
  std::string log;
  auto old = Logger::logLevel();
  Logger::setLogLevel(Logger::INFO);
  Logger::setOutput([&](const char* m, int sz) {
    std::lock_guard<std::mutex> l(mu);
    log.append(m, sz);
  });

  PaxosEnv env;
  env.Connect();

  // the learner already knows a greater pid and turns the announcement down.
  ASSERT_EQ(kErrCode_OK, env.learner_->Learn(100, "later"));

  auto start = GetCurrTimeMS();
  auto r = env.proposer_->Propose("v");
  ASSERT_TRUE(r.Committed());
  ASSERT_EQ("v", r.value_);

  // a refusal is an answer, the round does not wait for the timeout.
  ASSERT_LT(GetCurrTimeMS() - start, uint64_t(env.config_->timeout_ms_));

  uint64_t pid = 0;
  ASSERT_TRUE(env.learner_->GetChosen(&pid, NULL));
  ASSERT_EQ(100u, pid);

  Logger::resetOutput();
  Logger::setLogLevel(old);

  std::lock_guard<std::mutex> l(mu);
  ASSERT_TRUE(log.find("learner refused chosen value") != std::string::npos);
  ASSERT_TRUE(log.find("STALE_PROPOSAL") != std::string::npos);
  ASSERT_TRUE(log.find("learn phase incomplete") != std::string::npos);
}
