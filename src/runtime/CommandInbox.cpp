// Repository: Stagehand
// Component: CommandInbox / ViewStatusBoard
// Purpose: Thread-safe edge between control-plane threads and the tick loop.
// Copyright (c) 2025 Stagehand

#include "stagehand/runtime/CommandInbox.h"

namespace stagehand::runtime {

CommandInbox::CommandInbox(std::size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

bool CommandInbox::Push(ViewCommand command) {
  std::lock_guard<std::mutex> lock(mutex_);
  bool kept_all = true;
  if (queue_.size() >= capacity_) {
    queue_.pop_front();
    ++dropped_total_;
    kept_all = false;
  }
  queue_.push_back(command);
  return kept_all;
}

std::optional<ViewCommand> CommandInbox::PopOne() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (queue_.empty()) {
    return std::nullopt;
  }
  ViewCommand command = queue_.front();
  queue_.pop_front();
  return command;
}

std::size_t CommandInbox::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

uint64_t CommandInbox::dropped_total() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return dropped_total_;
}

void ViewStatusBoard::Publish(const ViewStatus& status) {
  std::lock_guard<std::mutex> lock(mutex_);
  status_ = status;
}

ViewStatus ViewStatusBoard::Read() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return status_;
}

}  // namespace stagehand::runtime
