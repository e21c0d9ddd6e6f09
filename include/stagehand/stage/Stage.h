// Repository: Stagehand
// Component: Stage
// Purpose: In-memory presentation host: contexts, nodes, audio sinks and a
//          simulation process, with tick-driven async load/unload.
// Copyright (c) 2025 Stagehand

#ifndef STAGEHAND_STAGE_STAGE_H_
#define STAGEHAND_STAGE_STAGE_H_

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "stagehand/audio/IAudioSink.h"
#include "stagehand/presentation/IOverlayControlSurface.h"
#include "stagehand/presentation/IPresentationLoader.h"
#include "stagehand/presentation/IViewContainer.h"
#include "stagehand/runtime/PersistentProcessAnchor.h"

namespace stagehand::stage {

// Name of the pseudo-context that holds persistent nodes. It is never
// unloaded and cannot be registered as a presentation.
inline constexpr const char* kPersistentContextName = "Persistent";

struct StageNode {
  std::string name;
  std::string context_name;
  bool active = true;
  bool persistent = false;
  std::string process_name;  // Empty: no simulation process on this node
};

class StageAudioSink : public audio::IAudioSink {
 public:
  StageAudioSink(std::string name, std::shared_ptr<StageNode> node, bool enabled);

  std::string GetName() const override { return name_; }
  std::string GetContextName() const override { return node_->context_name; }
  std::string GetNodeName() const override { return node_->name; }
  bool IsActiveInHierarchy() const override { return active_ && node_->active; }
  bool IsEnabled() const override { return enabled_; }
  void SetEnabled(bool enabled) override;

  // Deactivates the sink component itself (the node stays as it is).
  void SetActive(bool active) { active_ = active; }

  [[nodiscard]] uint64_t toggle_count() const { return toggle_count_; }

 private:
  std::string name_;
  std::shared_ptr<StageNode> node_;
  bool enabled_;
  bool active_ = true;
  uint64_t toggle_count_ = 0;
};

// View container backed by a stage node. Visibility is the node's active flag,
// so sinks under a hidden container become unreachable.
class StageContainer : public presentation::IViewContainer {
 public:
  explicit StageContainer(std::shared_ptr<StageNode> node);

  std::string GetName() const override { return node_->name; }
  bool IsVisible() const override { return node_->active; }
  void SetVisible(bool visible) override { node_->active = visible; }

 private:
  std::shared_ptr<StageNode> node_;
};

// One loaded presentation. Nodes and sinks keep insertion order.
struct StageContext {
  std::string name;
  std::vector<std::shared_ptr<StageNode>> nodes;
  std::vector<std::shared_ptr<StageAudioSink>> sinks;
  std::shared_ptr<presentation::IOverlayControlSurface> control_surface;
};

// Handed to a presentation's populate function when its context loads.
class ContextBuilder {
 public:
  ContextBuilder& AddNode(const std::string& name, bool active = true);
  ContextBuilder& AddAudioSink(const std::string& sink_name,
                               const std::string& node_name,
                               bool enabled = true);
  ContextBuilder& AddSimulationProcess(const std::string& process_name,
                                       const std::string& node_name);
  ContextBuilder& SetControlSurface(
      std::shared_ptr<presentation::IOverlayControlSurface> surface);

 private:
  friend class Stage;

  explicit ContextBuilder(StageContext* context) : context_(context) {}

  std::shared_ptr<StageNode> NodeOrCreate(const std::string& name);

  StageContext* context_;
};

// Stage
//
// Reference host for the coordinator's collaborators. A presentation is a
// registered populate function; loading it builds a context of nodes and
// sinks. Operations complete after `completion_ticks` calls to Advance(),
// on the caller's thread.
//
// The coordinator's own node lives in the persistent context. Marking a node
// persistent moves it (and its sinks) there, so it survives unload of the
// context that created it.
//
// Not thread-safe. Drive it from the tick thread.
class Stage : public presentation::IPresentationLoader,
              public audio::IAudioSinkSource,
              public runtime::IProcessHost {
 public:
  using PopulateFn = std::function<void(ContextBuilder&)>;
  using ControlSurfaceListener =
      std::function<void(std::weak_ptr<presentation::IOverlayControlSurface>)>;

  // coordinator_node is created in the persistent context.
  explicit Stage(std::string coordinator_node = "Stagehand",
                 int completion_ticks = 1);
  ~Stage() override;

  Stage(const Stage&) = delete;
  Stage& operator=(const Stage&) = delete;

  // Returns false if the name is empty, reserved or already registered.
  bool RegisterPresentation(const std::string& name, PopulateFn populate);

  // Loads a registered presentation right away, without a completion.
  // Returns false if unregistered or already loaded.
  bool LoadNow(const std::string& name);

  // Called whenever a loaded context carries a control surface, before the
  // load completion is delivered.
  void SetControlSurfaceListener(ControlSurfaceListener listener);

  // The next load/unload that completes reports failure with this reason.
  void FailNextLoad(std::string reason);
  void FailNextUnload(std::string reason);

  // Advances pending operations by one tick and delivers those that finish.
  // Returns how many completed.
  std::size_t Advance();

  // Container view over a node in any loaded context, or nullptr.
  std::shared_ptr<presentation::IViewContainer> ContainerFor(const std::string& node_name);

  [[nodiscard]] bool IsLoaded(const std::string& context_name) const;
  [[nodiscard]] std::vector<std::string> LoadedContexts() const;
  [[nodiscard]] std::size_t PendingOperations() const { return pending_.size(); }
  [[nodiscard]] std::shared_ptr<StageAudioSink> FindSink(const std::string& sink_name) const;
  [[nodiscard]] std::shared_ptr<StageNode> FindNode(const std::string& node_name) const;

  // IPresentationLoader
  std::optional<presentation::OperationHandle> LoadOverlay(
      const std::string& name, presentation::CompletionCallback on_complete) override;
  std::optional<presentation::OperationHandle> UnloadOverlay(
      const std::string& name, presentation::CompletionCallback on_complete) override;

  // IAudioSinkSource
  std::vector<std::shared_ptr<audio::IAudioSink>> EnumerateSinks() const override;
  std::shared_ptr<audio::IAudioSink> CreateFallbackSink(const std::string& name) override;

  // IProcessHost
  std::optional<runtime::ProcessLocation> FindCoLocatedProcess() const override;
  std::optional<runtime::ProcessLocation> FindProcessInContext(
      const std::string& context_name) const override;
  bool MarkPersistent(const std::string& container_name) override;

 private:
  struct PendingOperation {
    presentation::OperationHandle handle;
    presentation::CompletionCallback on_complete;
    int ticks_remaining = 0;
  };

  StageContext* FindContext(const std::string& name) const;
  StageContext& PersistentContext() const;
  bool BuildContext(const std::string& name);
  void DestroyContext(const std::string& name);
  presentation::OperationResult Complete(const presentation::OperationHandle& handle);

  std::string coordinator_node_;
  int completion_ticks_;
  uint64_t next_op_id_ = 1;

  std::map<std::string, PopulateFn> presentations_;
  // Load order; the persistent context is always first.
  std::vector<std::unique_ptr<StageContext>> contexts_;
  std::vector<PendingOperation> pending_;

  ControlSurfaceListener control_surface_listener_;
  std::optional<std::string> fail_next_load_;
  std::optional<std::string> fail_next_unload_;
};

}  // namespace stagehand::stage

#endif  // STAGEHAND_STAGE_STAGE_H_
