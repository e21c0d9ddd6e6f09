// Repository: Stagehand
// Component: CompletionChannel
// Purpose: Hands loader completions to the tick thread.
// Copyright (c) 2025 Stagehand

#ifndef STAGEHAND_RUNTIME_COMPLETION_CHANNEL_H_
#define STAGEHAND_RUNTIME_COMPLETION_CHANNEL_H_

#include <deque>
#include <mutex>
#include <vector>

#include "stagehand/presentation/IPresentationLoader.h"

namespace stagehand::runtime {

// Loaders may report completion from any thread. Results are posted here and
// applied by the coordinator at the start of its next tick, which keeps every
// mutation of view state serialized with input dispatch.
class CompletionChannel {
 public:
  CompletionChannel() = default;

  CompletionChannel(const CompletionChannel&) = delete;
  CompletionChannel& operator=(const CompletionChannel&) = delete;

  // Thread-safe.
  void Post(const presentation::OperationResult& result);

  // Removes and returns everything posted so far, oldest first.
  std::vector<presentation::OperationResult> DrainAll();

 private:
  mutable std::mutex mutex_;
  std::deque<presentation::OperationResult> queue_;
};

}  // namespace stagehand::runtime

#endif  // STAGEHAND_RUNTIME_COMPLETION_CHANNEL_H_
