#ifndef __WT_CLOCK__
#define __WT_CLOCK__

#include "Headers.hpp"

namespace wt {
/**
 * @brief Millisecond time source used for every deadline, throttle and poll in
 * the engine.
 */
class Clock {
 public:
  virtual ~Clock() {}

  virtual int64_t now() = 0;
};

class SteadyClock : public Clock {
 public:
  virtual int64_t now() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
  }
};
}  // namespace wt

#endif  // __WT_CLOCK__
