// Repository: Stagehand
// Component: CompletionChannel
// Purpose: Hands loader completions to the tick thread.
// Copyright (c) 2025 Stagehand

#include "stagehand/runtime/CompletionChannel.h"

namespace stagehand::runtime {

void CompletionChannel::Post(const presentation::OperationResult& result) {
  std::lock_guard<std::mutex> lock(mutex_);
  queue_.push_back(result);
}

std::vector<presentation::OperationResult> CompletionChannel::DrainAll() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<presentation::OperationResult> drained(queue_.begin(), queue_.end());
  queue_.clear();
  return drained;
}

}  // namespace stagehand::runtime
