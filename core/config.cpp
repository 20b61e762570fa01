#include "config.h"

#include "ptype.h"
#include "logger.h"

#include <fstream>
#include <sstream>
#include <stdlib.h>
#include <errno.h>

namespace synod {

namespace {

std::string Trim(const std::string& s) {
  auto b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos) return "";

  auto e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

bool ParseUint32(const std::string& s, uint32_t& out) {
  if (s.empty() || s[0] == '-') return false;

  errno = 0;
  char* end = NULL;
  auto v = strtoul(s.c_str(), &end, 10);
  if (errno != 0 || *end != '\0' || v > 0xffffffffull) return false;

  out = uint32_t(v);
  return true;
}

bool ParseAddr(const std::string& s, AddrInfo& addr) {
  std::istringstream is(s);
  std::string id;
  std::string host;
  std::string extra;

  if (!(is >> id >> host) || (is >> extra)) return false;

  uint32_t v = 0;
  if (!ParseUint32(id, v) || v > 0x7fffffffu) return false;

  addr.id_ = int(v);
  addr.type_ = kAddrType_INPROC;
  addr.addr_ = host;
  return true;
}

}  // namespace

int GetAcceptorIndex(const Configure& config, int svr_id) {
  for (auto i = 0u; i < config.peer_.size(); i++) {
    if (config.peer_[i].id_ == svr_id) return int(i);
  }
  return -1;
}

int CheckConfig(const Configure& config) {
  if (config.timeout_ms_ == 0 || config.backoff_factor_ == 0) {
    return kErrCode_INVALID_CONFIG;
  }

  if (config.total_acceptor_ == 0 || config.worker_msg_queue_sz_ == 0) {
    return kErrCode_INVALID_CONFIG;
  }

  if (!config.peer_.empty() && config.peer_.size() != config.total_acceptor_) {
    return kErrCode_INVALID_CONFIG;
  }

  if (config.storage_type_ != kStorageType_MEM && config.storage_type_ != kStorageType_FILE) {
    return kErrCode_INVALID_CONFIG;
  }

  if (config.storage_type_ == kStorageType_FILE && config.local_storage_path_.empty()) {
    return kErrCode_INVALID_CONFIG;
  }

  for (auto i = 0u; i < config.peer_.size(); i++) {
    for (auto j = 0u; j < config.learner_.size(); j++) {
      if (config.peer_[i].id_ == config.learner_[j].id_) {
        return kErrCode_INVALID_CONFIG;
      }
    }
  }

  return kErrCode_OK;
}

int InitConfigFromString(const std::string& content, Configure& config) {
  Configure conf;
  conf.peer_.clear();
  conf.learner_.clear();

  bool has_total = false;
  std::istringstream is(content);
  std::string line;
  int lineno = 0;

  while (std::getline(is, line)) {
    lineno++;

    auto comment = line.find('#');
    if (comment != std::string::npos) line.resize(comment);

    line = Trim(line);
    if (line.empty()) continue;

    auto eq = line.find('=');
    if (eq == std::string::npos) {
      LOG_ERR << "invalid config line " << lineno << ": missing '='";
      return kErrCode_INVALID_CONFIG;
    }

    auto key = Trim(line.substr(0, eq));
    auto val = Trim(line.substr(eq + 1));

    bool ok = true;
    if (key == "timeout_ms") {
      ok = ParseUint32(val, conf.timeout_ms_);
    } else if (key == "total_acceptor") {
      ok = ParseUint32(val, conf.total_acceptor_);
      has_total = true;
    } else if (key == "max_prepare_retry") {
      ok = ParseUint32(val, conf.max_prepare_retry_);
    } else if (key == "backoff_init_ms") {
      ok = ParseUint32(val, conf.backoff_init_ms_);
    } else if (key == "backoff_max_ms") {
      ok = ParseUint32(val, conf.backoff_max_ms_);
    } else if (key == "backoff_factor") {
      ok = ParseUint32(val, conf.backoff_factor_);
    } else if (key == "worker_msg_queue_sz") {
      ok = ParseUint32(val, conf.worker_msg_queue_sz_);
    } else if (key == "msg_version") {
      ok = ParseUint32(val, conf.msg_version_);
    } else if (key == "storage_type") {
      if (val == "mem") {
        conf.storage_type_ = kStorageType_MEM;
      } else if (val == "file") {
        conf.storage_type_ = kStorageType_FILE;
      } else {
        ok = false;
      }
    } else if (key == "storage_path") {
      conf.local_storage_path_ = val;
    } else if (key == "log_level") {
      Logger::LogLevel level = Logger::INFO;
      ok = Logger::parseLogLevel(val, level);
      if (ok) Logger::setLogLevel(level);
    } else if (key == "local") {
      ok = ParseAddr(val, conf.local_);
    } else if (key == "peer" || key == "learner") {
      AddrInfo addr;
      ok = ParseAddr(val, addr);
      if (ok) {
        auto& list = (key == "peer") ? conf.peer_ : conf.learner_;
        list.push_back(std::move(addr));
      }
    } else {
      LOG_ERR << "unknown config key at line " << lineno << ": " << key;
      return kErrCode_INVALID_CONFIG;
    }

    if (!ok) {
      LOG_ERR << "invalid value for config key at line " << lineno << ": " << key << " = " << val;
      return kErrCode_INVALID_CONFIG;
    }
  }

  if (!has_total && !conf.peer_.empty()) {
    conf.total_acceptor_ = uint32_t(conf.peer_.size());
  }

  auto ret = CheckConfig(conf);
  if (ret != kErrCode_OK) {
    LOG_ERR << "config check failed, acceptors:" << conf.total_acceptor_
            << ", peers:" << conf.peer_.size() << ", learners:" << conf.learner_.size();
    return ret;
  }

  config = std::move(conf);
  return kErrCode_OK;
}

int InitConfigFromFile(const std::string& path, Configure& config) {
  std::ifstream in(path);
  if (!in) {
    LOG_ERR << "open config file failed, path:" << path;
    return kErrCode_CONFIG_NOT_EXIST;
  }

  std::stringstream ss;
  ss << in.rdbuf();
  return InitConfigFromString(ss.str(), config);
}

}  // namespace synod
