#include "plog.h"

#include "logger.h"

#include <errno.h>
#include <fcntl.h>
#include <stdio.h>
#include <string.h>
#include <unistd.h>
#include <sys/stat.h>

namespace synod {

constexpr uint32_t kPlogMagic = 0x504c4f47;
constexpr uint32_t kPlogVersion = 1;

uint32_t PlogChecksum(const uint8_t* data, size_t sz) {
  // fnv-1a
  uint32_t h = 2166136261u;
  for (size_t i = 0; i < sz; i++) {
    h ^= data[i];
    h *= 16777619u;
  }
  return h;
}

int MemStateStore::Load(AcceptorState& state) {
  std::lock_guard<std::mutex> l(mutex_);
  state = state_;
  return kErrCode_OK;
}

int MemStateStore::Save(const AcceptorState& state) {
  std::lock_guard<std::mutex> l(mutex_);
  state_ = state;
  return kErrCode_OK;
}

FileStateStore::FileStateStore(std::string dir, int svr_id) {
  if (!dir.empty() && dir.back() != '/') dir.push_back('/');
  path_ = dir + "acceptor_" + std::to_string(svr_id) + ".plog";
}

int FileStateStore::Load(AcceptorState& state) {
  int fd = open(path_.c_str(), O_RDONLY);
  if (fd < 0) {
    if (errno == ENOENT) {
      state = AcceptorState();
      return kErrCode_OK;
    }

    LOG_ERR << "open plog failed, path:" << path_ << ", errno:" << errno;
    return kErrCode_LOAD_PLOG_FAIL;
  }

  std::string buff;
  char chunk[4096];

  while (true) {
    auto n = read(fd, chunk, sizeof(chunk));
    if (n < 0) {
      if (errno == EINTR) continue;

      close(fd);
      LOG_ERR << "read plog failed, path:" << path_ << ", errno:" << errno;
      return kErrCode_LOAD_PLOG_FAIL;
    }

    if (n == 0) break;
    buff.append(chunk, size_t(n));
  }

  close(fd);

  if (buff.size() < PlogStateHeaderSz) {
    LOG_ERR << "truncated plog, path:" << path_ << ", size:" << buff.size();
    return kErrCode_INVALID_PLOG_DATA;
  }

  auto raw = reinterpret_cast<PlogStateRaw*>(&buff[0]);
  if (raw->magic_ != kPlogMagic || raw->version_ != kPlogVersion ||
      buff.size() != PlogStateHeaderSz + raw->size_) {
    LOG_ERR << "invalid plog header, path:" << path_ << ", magic:" << raw->magic_
            << ", version:" << raw->version_ << ", vsz:" << raw->size_;
    return kErrCode_INVALID_PLOG_DATA;
  }

  uint32_t checksum = raw->checksum_;
  raw->checksum_ = 0;
  if (checksum != PlogChecksum(reinterpret_cast<const uint8_t*>(buff.data()), buff.size())) {
    LOG_ERR << "plog checksum mismatch, path:" << path_;
    return kErrCode_INVALID_PLOG_DATA;
  }

  state.promised_ = raw->promised_;
  state.accepted_ = raw->accepted_;
  state.value_.assign(reinterpret_cast<const char*>(raw->data_), raw->size_);
  return kErrCode_OK;
}

int FileStateStore::Save(const AcceptorState& state) {
  std::string buff(PlogStateHeaderSz + state.value_.size(), '\0');
  auto raw = reinterpret_cast<PlogStateRaw*>(&buff[0]);

  raw->magic_ = kPlogMagic;
  raw->version_ = kPlogVersion;
  raw->promised_ = state.promised_;
  raw->accepted_ = state.accepted_;
  raw->size_ = uint32_t(state.value_.size());
  memcpy(raw->data_, state.value_.data(), state.value_.size());
  raw->checksum_ = 0;
  raw->checksum_ = PlogChecksum(reinterpret_cast<const uint8_t*>(buff.data()), buff.size());

  // write to a temp file and rename, a crash never leaves a torn state.
  auto tmp = path_ + ".tmp";
  int fd = open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
  if (fd < 0) {
    LOG_ERR << "create plog failed, path:" << tmp << ", errno:" << errno;
    return kErrCode_WRITE_PLOG_FAIL;
  }

  size_t off = 0;
  while (off < buff.size()) {
    auto n = write(fd, buff.data() + off, buff.size() - off);
    if (n < 0) {
      if (errno == EINTR) continue;

      LOG_ERR << "write plog failed, path:" << tmp << ", errno:" << errno;
      close(fd);
      unlink(tmp.c_str());
      return kErrCode_WRITE_PLOG_FAIL;
    }
    off += size_t(n);
  }

  if (fsync(fd) != 0) {
    LOG_ERR << "fsync plog failed, path:" << tmp << ", errno:" << errno;
    close(fd);
    unlink(tmp.c_str());
    return kErrCode_WRITE_PLOG_FAIL;
  }

  close(fd);

  if (rename(tmp.c_str(), path_.c_str()) != 0) {
    LOG_ERR << "rename plog failed, path:" << path_ << ", errno:" << errno;
    unlink(tmp.c_str());
    return kErrCode_WRITE_PLOG_FAIL;
  }

  return kErrCode_OK;
}

std::unique_ptr<StateStore> CreateStateStore(const Configure& config) {
  if (config.storage_type_ == kStorageType_FILE) {
    return std::unique_ptr<StateStore>(new FileStateStore(config.local_storage_path_, config.local_.id_));
  }

  return std::unique_ptr<StateStore>(new MemStateStore());
}

}  // namespace synod
