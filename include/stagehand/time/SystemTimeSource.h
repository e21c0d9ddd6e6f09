// Repository: Stagehand
// Component: System Time Source
// Purpose: Steady-clock backed ITimeSource for production hosts.
// Copyright (c) 2025 Stagehand

#ifndef STAGEHAND_TIME_SYSTEM_TIME_SOURCE_H_
#define STAGEHAND_TIME_SYSTEM_TIME_SOURCE_H_

#include <chrono>

#include "stagehand/time/ITimeSource.h"

namespace stagehand::time {

class SystemTimeSource : public ITimeSource {
 public:
  int64_t NowMonotonicMs() const override {
    using namespace std::chrono;
    return duration_cast<milliseconds>(
        steady_clock::now().time_since_epoch()).count();
  }
};

}  // namespace stagehand::time

#endif  // STAGEHAND_TIME_SYSTEM_TIME_SOURCE_H_
