#ifndef __SYNOD_BACKOFF_H_
#define __SYNOD_BACKOFF_H_

#include <stdint.h>
#include <algorithm>

namespace synod {

// exponential backoff between two attempts of a proposer, in milliseconds.
class Backoff {
 public:
  struct Params {
    uint32_t init_;
    uint32_t max_;
    uint32_t factor_;
  };

  explicit Backoff(Params params) : params_(params), next_(params.init_) {}

  // returns the delay to wait before the next attempt
  uint32_t operator()() {
    auto curr = next_;
    next_ = ComputeNext(curr);
    return curr;
  }

  void Reset() { next_ = params_.init_; }

 private:
  uint32_t ComputeNext(uint32_t curr) const {
    uint64_t next = uint64_t(curr) * std::max<uint32_t>(params_.factor_, 1);
    return uint32_t(std::min<uint64_t>(params_.max_, next));
  }

 private:
  const Params params_;
  uint32_t next_;
};

}  // namespace synod

#endif
