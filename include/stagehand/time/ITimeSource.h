// Repository: Stagehand
// Component: Time Source Interface
// Purpose: Injectable monotonic clock for interval-driven work on the tick thread.
// Copyright (c) 2025 Stagehand

#ifndef STAGEHAND_TIME_ITIME_SOURCE_H_
#define STAGEHAND_TIME_ITIME_SOURCE_H_

#include <cstdint>

namespace stagehand::time {

class ITimeSource {
 public:
  virtual ~ITimeSource() = default;

  // Milliseconds on a clock that never goes backwards. Epoch is arbitrary.
  virtual int64_t NowMonotonicMs() const = 0;
};

}  // namespace stagehand::time

#endif  // STAGEHAND_TIME_ITIME_SOURCE_H_
