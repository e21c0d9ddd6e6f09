// Repository: Stagehand
// Component: CommandInbox / ViewStatusBoard
// Purpose: Thread-safe edge between control-plane threads and the tick loop.
// Copyright (c) 2025 Stagehand

#ifndef STAGEHAND_RUNTIME_COMMAND_INBOX_H_
#define STAGEHAND_RUNTIME_COMMAND_INBOX_H_

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

#include "stagehand/runtime/ViewTypes.h"

namespace stagehand::runtime {

// CommandInbox queues commands issued from threads other than the tick
// thread (gRPC handlers). The tick loop pops at most one per tick, so the
// coordinator still sees at most one command per tick.
//
// Bounded: when full, the oldest command is dropped and counted.
class CommandInbox {
 public:
  static constexpr std::size_t kDefaultCapacity = 16;

  explicit CommandInbox(std::size_t capacity = kDefaultCapacity);

  CommandInbox(const CommandInbox&) = delete;
  CommandInbox& operator=(const CommandInbox&) = delete;

  // Thread-safe. Returns false if an older command had to be dropped.
  bool Push(ViewCommand command);

  // Thread-safe.
  std::optional<ViewCommand> PopOne();

  std::size_t Size() const;
  uint64_t dropped_total() const;

 private:
  const std::size_t capacity_;
  mutable std::mutex mutex_;
  std::deque<ViewCommand> queue_;
  uint64_t dropped_total_ = 0;
};

// Status published by the tick loop after every tick, read by the control
// plane. Plain values only; never a reference into the coordinator.
struct ViewStatus {
  ViewState view = ViewState::kPrimary;
  bool overlay_loaded = false;
  bool transition_locked = false;
  bool deferred_pending = false;
  bool process_anchored = false;
  std::string audio_winner;
  uint64_t tick = 0;
};

class ViewStatusBoard {
 public:
  void Publish(const ViewStatus& status);
  ViewStatus Read() const;

 private:
  mutable std::mutex mutex_;
  ViewStatus status_;
};

}  // namespace stagehand::runtime

#endif  // STAGEHAND_RUNTIME_COMMAND_INBOX_H_
