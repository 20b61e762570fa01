#ifndef __SYNOD_TIME_H__
#define __SYNOD_TIME_H__

#include <stdint.h>
#include <sys/time.h>

namespace synod {

inline uint64_t GetCurrTimeUS() {
  struct timeval tv;
  gettimeofday(&tv, NULL);

  return (uint64_t)tv.tv_sec * 1000000 + tv.tv_usec;
}

inline uint64_t GetCurrTimeMS() { return GetCurrTimeUS() / 1000; }

}  // namespace synod

#endif
