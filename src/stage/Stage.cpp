// Repository: Stagehand
// Component: Stage
// Purpose: In-memory presentation host: contexts, nodes, audio sinks and a
//          simulation process, with tick-driven async load/unload.
// Copyright (c) 2025 Stagehand

#include "stagehand/stage/Stage.h"

#include <algorithm>
#include <utility>

#include "stagehand/util/Logger.hpp"

namespace stagehand::stage {

using util::Logger;

StageAudioSink::StageAudioSink(std::string name, std::shared_ptr<StageNode> node,
                               bool enabled)
    : name_(std::move(name)), node_(std::move(node)), enabled_(enabled) {}

void StageAudioSink::SetEnabled(bool enabled) {
  if (enabled_ == enabled) return;
  enabled_ = enabled;
  ++toggle_count_;
}

StageContainer::StageContainer(std::shared_ptr<StageNode> node)
    : node_(std::move(node)) {}

// ---------------------------------------------------------------------------
// ContextBuilder
// ---------------------------------------------------------------------------

std::shared_ptr<StageNode> ContextBuilder::NodeOrCreate(const std::string& name) {
  for (const auto& node : context_->nodes) {
    if (node->name == name) return node;
  }
  auto node = std::make_shared<StageNode>();
  node->name = name;
  node->context_name = context_->name;
  context_->nodes.push_back(node);
  return node;
}

ContextBuilder& ContextBuilder::AddNode(const std::string& name, bool active) {
  NodeOrCreate(name)->active = active;
  return *this;
}

ContextBuilder& ContextBuilder::AddAudioSink(const std::string& sink_name,
                                             const std::string& node_name,
                                             bool enabled) {
  context_->sinks.push_back(
      std::make_shared<StageAudioSink>(sink_name, NodeOrCreate(node_name), enabled));
  return *this;
}

ContextBuilder& ContextBuilder::AddSimulationProcess(const std::string& process_name,
                                                     const std::string& node_name) {
  NodeOrCreate(node_name)->process_name = process_name;
  return *this;
}

ContextBuilder& ContextBuilder::SetControlSurface(
    std::shared_ptr<presentation::IOverlayControlSurface> surface) {
  context_->control_surface = std::move(surface);
  return *this;
}

// ---------------------------------------------------------------------------
// Stage
// ---------------------------------------------------------------------------

Stage::Stage(std::string coordinator_node, int completion_ticks)
    : coordinator_node_(std::move(coordinator_node)),
      completion_ticks_(std::max(1, completion_ticks)) {
  auto persistent = std::make_unique<StageContext>();
  persistent->name = kPersistentContextName;
  ContextBuilder builder(persistent.get());
  builder.AddNode(coordinator_node_);
  persistent->nodes.front()->persistent = true;
  contexts_.push_back(std::move(persistent));
}

Stage::~Stage() {
  if (!pending_.empty()) {
    Logger::Debug("[Stage] Destroyed with " + std::to_string(pending_.size()) +
                  " pending operation(s); completions dropped");
  }
}

bool Stage::RegisterPresentation(const std::string& name, PopulateFn populate) {
  if (name.empty() || name == kPersistentContextName || !populate) {
    Logger::Warn("[Stage] Rejected presentation registration '" + name + "'");
    return false;
  }
  return presentations_.emplace(name, std::move(populate)).second;
}

bool Stage::LoadNow(const std::string& name) {
  return BuildContext(name);
}

void Stage::SetControlSurfaceListener(ControlSurfaceListener listener) {
  control_surface_listener_ = std::move(listener);
}

void Stage::FailNextLoad(std::string reason) {
  fail_next_load_ = std::move(reason);
}

void Stage::FailNextUnload(std::string reason) {
  fail_next_unload_ = std::move(reason);
}

std::size_t Stage::Advance() {
  std::vector<PendingOperation> finished;
  for (auto it = pending_.begin(); it != pending_.end();) {
    if (--it->ticks_remaining <= 0) {
      finished.push_back(std::move(*it));
      it = pending_.erase(it);
    } else {
      ++it;
    }
  }

  // Callbacks run after the pending list is settled; they may issue new work.
  for (auto& op : finished) {
    auto result = Complete(op.handle);
    if (op.on_complete) {
      op.on_complete(result);
    }
  }
  return finished.size();
}

std::shared_ptr<presentation::IViewContainer> Stage::ContainerFor(
    const std::string& node_name) {
  auto node = FindNode(node_name);
  if (!node) return nullptr;
  return std::make_shared<StageContainer>(std::move(node));
}

bool Stage::IsLoaded(const std::string& context_name) const {
  return FindContext(context_name) != nullptr;
}

std::vector<std::string> Stage::LoadedContexts() const {
  std::vector<std::string> names;
  names.reserve(contexts_.size());
  for (const auto& context : contexts_) {
    names.push_back(context->name);
  }
  return names;
}

std::shared_ptr<StageAudioSink> Stage::FindSink(const std::string& sink_name) const {
  for (const auto& context : contexts_) {
    for (const auto& sink : context->sinks) {
      if (sink->GetName() == sink_name) return sink;
    }
  }
  return nullptr;
}

std::shared_ptr<StageNode> Stage::FindNode(const std::string& node_name) const {
  for (const auto& context : contexts_) {
    for (const auto& node : context->nodes) {
      if (node->name == node_name) return node;
    }
  }
  return nullptr;
}

std::optional<presentation::OperationHandle> Stage::LoadOverlay(
    const std::string& name, presentation::CompletionCallback on_complete) {
  if (presentations_.find(name) == presentations_.end()) {
    Logger::Warn("[Stage] Load of unregistered presentation '" + name + "'");
    return std::nullopt;
  }
  if (IsLoaded(name)) {
    Logger::Warn("[Stage] Presentation '" + name + "' is already loaded");
    return std::nullopt;
  }

  presentation::OperationHandle handle{next_op_id_++, presentation::OperationKind::kLoad,
                                       name};
  pending_.push_back({handle, std::move(on_complete), completion_ticks_});
  Logger::Debug("[Stage] Load '" + name + "' queued (op " + std::to_string(handle.id) + ")");
  return handle;
}

std::optional<presentation::OperationHandle> Stage::UnloadOverlay(
    const std::string& name, presentation::CompletionCallback on_complete) {
  if (name == kPersistentContextName || !IsLoaded(name)) {
    return std::nullopt;
  }

  presentation::OperationHandle handle{next_op_id_++, presentation::OperationKind::kUnload,
                                       name};
  pending_.push_back({handle, std::move(on_complete), completion_ticks_});
  Logger::Debug("[Stage] Unload '" + name + "' queued (op " + std::to_string(handle.id) +
                ")");
  return handle;
}

std::vector<std::shared_ptr<audio::IAudioSink>> Stage::EnumerateSinks() const {
  std::vector<std::shared_ptr<audio::IAudioSink>> sinks;
  for (const auto& context : contexts_) {
    sinks.insert(sinks.end(), context->sinks.begin(), context->sinks.end());
  }
  return sinks;
}

std::shared_ptr<audio::IAudioSink> Stage::CreateFallbackSink(const std::string& name) {
  if (name.empty()) {
    return nullptr;
  }
  ContextBuilder builder(&PersistentContext());
  builder.AddAudioSink(name, name, true);
  auto sink = PersistentContext().sinks.back();
  FindNode(name)->persistent = true;
  Logger::Debug("[Stage] Created fallback sink '" + name + "'");
  return sink;
}

std::optional<runtime::ProcessLocation> Stage::FindCoLocatedProcess() const {
  for (const auto& node : PersistentContext().nodes) {
    if (node->name == coordinator_node_ && !node->process_name.empty()) {
      return runtime::ProcessLocation{node->process_name, node->name,
                                      node->context_name, true};
    }
  }
  return std::nullopt;
}

std::optional<runtime::ProcessLocation> Stage::FindProcessInContext(
    const std::string& context_name) const {
  const StageContext* context = FindContext(context_name);
  if (!context) return std::nullopt;
  for (const auto& node : context->nodes) {
    if (!node->process_name.empty()) {
      return runtime::ProcessLocation{node->process_name, node->name,
                                      node->context_name, false};
    }
  }
  return std::nullopt;
}

bool Stage::MarkPersistent(const std::string& container_name) {
  StageContext& persistent = PersistentContext();
  for (auto& context : contexts_) {
    auto& nodes = context->nodes;
    auto it = std::find_if(nodes.begin(), nodes.end(),
                           [&](const std::shared_ptr<StageNode>& n) {
                             return n->name == container_name;
                           });
    if (it == nodes.end()) continue;

    auto node = *it;
    if (context.get() == &persistent) {
      node->persistent = true;
      return true;
    }

    // Move the node and every sink attached to it.
    nodes.erase(it);
    node->persistent = true;
    node->context_name = kPersistentContextName;
    persistent.nodes.push_back(node);

    auto& sinks = context->sinks;
    for (auto sit = sinks.begin(); sit != sinks.end();) {
      if ((*sit)->GetNodeName() == container_name &&
          (*sit)->GetContextName() == kPersistentContextName) {
        persistent.sinks.push_back(*sit);
        sit = sinks.erase(sit);
      } else {
        ++sit;
      }
    }
    Logger::Debug("[Stage] Node '" + container_name + "' from '" + context->name +
                  "' is now persistent");
    return true;
  }
  return false;
}

StageContext* Stage::FindContext(const std::string& name) const {
  for (const auto& context : contexts_) {
    if (context->name == name) return context.get();
  }
  return nullptr;
}

StageContext& Stage::PersistentContext() const {
  return *contexts_.front();
}

bool Stage::BuildContext(const std::string& name) {
  auto it = presentations_.find(name);
  if (it == presentations_.end() || IsLoaded(name)) {
    return false;
  }

  auto context = std::make_unique<StageContext>();
  context->name = name;
  ContextBuilder builder(context.get());
  it->second(builder);

  auto surface = context->control_surface;
  contexts_.push_back(std::move(context));
  Logger::Debug("[Stage] Context '" + name + "' loaded");

  if (surface && control_surface_listener_) {
    control_surface_listener_(surface);
  }
  return true;
}

void Stage::DestroyContext(const std::string& name) {
  contexts_.erase(std::remove_if(contexts_.begin(), contexts_.end(),
                                 [&](const std::unique_ptr<StageContext>& c) {
                                   return c->name == name &&
                                          c->name != kPersistentContextName;
                                 }),
                  contexts_.end());
  Logger::Debug("[Stage] Context '" + name + "' unloaded");
}

presentation::OperationResult Stage::Complete(const presentation::OperationHandle& handle) {
  presentation::OperationResult result;
  result.handle = handle;

  if (handle.kind == presentation::OperationKind::kLoad) {
    if (fail_next_load_) {
      result.message = *fail_next_load_;
      fail_next_load_.reset();
      return result;
    }
    result.success = BuildContext(handle.presentation);
    if (!result.success) {
      result.message = "context '" + handle.presentation + "' could not be built";
    }
    return result;
  }

  if (fail_next_unload_) {
    result.message = *fail_next_unload_;
    fail_next_unload_.reset();
    return result;
  }
  if (!IsLoaded(handle.presentation)) {
    result.message = "context '" + handle.presentation + "' is not loaded";
    return result;
  }
  DestroyContext(handle.presentation);
  result.success = true;
  return result;
}

}  // namespace stagehand::stage
