// Repository: Stagehand
// Component: PersistentProcessAnchor
// Purpose: Keeps the long-lived simulation process alive across every
//          presentation load/unload.
// Copyright (c) 2025 Stagehand

#ifndef STAGEHAND_RUNTIME_PERSISTENT_PROCESS_ANCHOR_H_
#define STAGEHAND_RUNTIME_PERSISTENT_PROCESS_ANCHOR_H_

#include <optional>
#include <string>

namespace stagehand::runtime {

// Where the simulation process lives.
struct ProcessLocation {
  std::string process_name;
  std::string container_name;
  std::string context_name;
  bool co_located = false;  // Hosted on the coordinator's own container
};

// IProcessHost is the host-side view of the scene needed to anchor the
// simulation process. The process itself is opaque: it is only located,
// never driven.
class IProcessHost {
 public:
  virtual ~IProcessHost() = default;

  // Simulation process on the coordinator's own container, if any.
  virtual std::optional<ProcessLocation> FindCoLocatedProcess() const = 0;

  // Simulation process anywhere in the named loaded context, if any.
  virtual std::optional<ProcessLocation> FindProcessInContext(
      const std::string& context_name) const = 0;

  // Marks the container persistent across every future load/unload.
  // Returns false if the container does not exist.
  virtual bool MarkPersistent(const std::string& container_name) = 0;
};

struct PersistentProcessHandle {
  ProcessLocation location;
  bool inherited = false;  // Persistence inherited from the coordinator's container
};

// PersistentProcessAnchor runs once at coordinator startup.
//
// Search order: co-located with the coordinator first, then the loaded
// primary context. A co-located process inherits the coordinator's own
// persistence; any other hosting container is marked persistent.
//
// A missing process is logged as a warning and is not a failure: view
// switching does not need the process, the anchor only guarantees it is not
// destroyed if it exists. Once established the handle is never re-evaluated.
class PersistentProcessAnchor {
 public:
  // host may be nullptr (no process hosting available; Establish() warns).
  PersistentProcessAnchor(IProcessHost* host, std::string primary_context);

  PersistentProcessAnchor(const PersistentProcessAnchor&) = delete;
  PersistentProcessAnchor& operator=(const PersistentProcessAnchor&) = delete;

  // First call locates and anchors. Later calls return the first result.
  const std::optional<PersistentProcessHandle>& Establish();

  [[nodiscard]] bool attempted() const { return attempted_; }
  [[nodiscard]] bool IsAnchored() const { return handle_.has_value(); }
  [[nodiscard]] const std::optional<PersistentProcessHandle>& handle() const {
    return handle_;
  }

 private:
  IProcessHost* host_;
  std::string primary_context_;
  bool attempted_ = false;
  std::optional<PersistentProcessHandle> handle_;
};

}  // namespace stagehand::runtime

#endif  // STAGEHAND_RUNTIME_PERSISTENT_PROCESS_ANCHOR_H_
