// Repository: Stagehand
// Component: DeferredActionQueue
// Purpose: Single-slot "do X when Y becomes ready" holder.
// Copyright (c) 2025 Stagehand

#ifndef STAGEHAND_RUNTIME_DEFERRED_ACTION_QUEUE_H_
#define STAGEHAND_RUNTIME_DEFERRED_ACTION_QUEUE_H_

#include <cstdint>
#include <functional>
#include <optional>

#include "stagehand/runtime/ViewTypes.h"

namespace stagehand::runtime {

// DeferredActionQueue holds at most one pending action.
//
// Set() is last-write-wins. With a single action kind in this system that is
// the same as an idempotent set: setting twice before a drain never grows
// anything and the action fires once.
//
// DrainIfPending() clears the slot BEFORE invoking the action, so an action
// that re-requests itself while running lands in an empty slot and is not
// fired again by the same drain.
//
// Not thread-safe. Owned and driven by the tick thread.
class DeferredActionQueue {
 public:
  using Invoker = std::function<void(DeferredAction)>;

  DeferredActionQueue() = default;

  DeferredActionQueue(const DeferredActionQueue&) = delete;
  DeferredActionQueue& operator=(const DeferredActionQueue&) = delete;

  void Set(DeferredAction action);

  // Discards the pending action without invoking it. Returns true if an
  // action was pending.
  bool Clear();

  // Returns true if an action was pending (and was therefore invoked).
  bool DrainIfPending(const Invoker& invoke);

  [[nodiscard]] bool HasPending() const { return pending_.has_value(); }
  [[nodiscard]] std::optional<DeferredAction> Pending() const { return pending_; }

  [[nodiscard]] uint64_t invoked_total() const { return invoked_total_; }
  [[nodiscard]] uint64_t discarded_total() const { return discarded_total_; }

 private:
  std::optional<DeferredAction> pending_;
  uint64_t invoked_total_ = 0;
  uint64_t discarded_total_ = 0;
};

}  // namespace stagehand::runtime

#endif  // STAGEHAND_RUNTIME_DEFERRED_ACTION_QUEUE_H_
