// Repository: Stagehand
// Component: DeferredActionQueue
// Purpose: Single-slot "do X when Y becomes ready" holder.
// Copyright (c) 2025 Stagehand

#include "stagehand/runtime/DeferredActionQueue.h"

namespace stagehand::runtime {

void DeferredActionQueue::Set(DeferredAction action) {
  pending_ = action;
}

bool DeferredActionQueue::Clear() {
  if (!pending_) {
    return false;
  }
  pending_.reset();
  ++discarded_total_;
  return true;
}

bool DeferredActionQueue::DrainIfPending(const Invoker& invoke) {
  if (!pending_) {
    return false;
  }

  // Slot is emptied before the action runs; a re-entrant Set() survives
  // this drain and waits for the next one.
  const DeferredAction action = *pending_;
  pending_.reset();
  ++invoked_total_;

  if (invoke) {
    invoke(action);
  }
  return true;
}

}  // namespace stagehand::runtime
