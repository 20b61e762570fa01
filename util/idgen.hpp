#ifndef __SYNOD_IDGEN_H_
#define __SYNOD_IDGEN_H_

#include <stdint.h>

namespace synod {

// IdGen generates proposal ids of the form start + k * step.
// each acceptor-capable node uses its own start(index + 1) with step equals to
// the number of acceptors, so ids never collide across the cluster and are
// totally ordered as plain integers.
class IdGen {
 public:
  IdGen(uint64_t start, uint64_t step) : id_(start), step_(step ? step : 1) {}

  uint64_t Get() const { return id_; }
  uint64_t GetStep() const { return step_; }

  uint64_t GetAndInc() {
    uint64_t v = id_;
    id_ += step_;
    return v;
  }

  void Reset(uint64_t start) { id_ = start; }

  // make sure next id is strictly greater than v, residue is preserved.
  uint64_t SetGreaterThan(uint64_t v) {
    if (v < id_) return id_;

    id_ += (v - id_ + step_) / step_ * step_;
    return id_;
  }

 private:
  uint64_t id_;
  uint64_t step_;
};

}  // namespace synod

#endif
