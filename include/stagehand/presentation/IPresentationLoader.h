// Repository: Stagehand
// Component: IPresentationLoader Interface
// Purpose: Asynchronous additive load/unload of the overlay presentation.
// Copyright (c) 2025 Stagehand

#ifndef STAGEHAND_PRESENTATION_IPRESENTATION_LOADER_H_
#define STAGEHAND_PRESENTATION_IPRESENTATION_LOADER_H_

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace stagehand::presentation {

enum class OperationKind {
  kLoad,
  kUnload,
};

const char* OperationKindToString(OperationKind kind);

// Identifies one issued load/unload. Ids are unique per loader.
struct OperationHandle {
  uint64_t id = 0;
  OperationKind kind = OperationKind::kLoad;
  std::string presentation;
};

struct OperationResult {
  OperationHandle handle;
  bool success = false;
  std::string message;  // Failure reason, empty on success
};

// Invoked exactly once per issued operation, on a later tick. May be invoked
// from a loader-owned thread; receivers must not assume the tick thread.
using CompletionCallback = std::function<void(const OperationResult&)>;

// IPresentationLoader performs the actual additive load/unload.
//
// Both calls return immediately. std::nullopt is the synchronous failure
// signal and no callback follows it:
//   LoadOverlay   -> presentation not registered/loadable
//   UnloadOverlay -> nothing was loaded under that name
class IPresentationLoader {
 public:
  virtual ~IPresentationLoader() = default;

  virtual std::optional<OperationHandle> LoadOverlay(
      const std::string& name, CompletionCallback on_complete) = 0;

  virtual std::optional<OperationHandle> UnloadOverlay(
      const std::string& name, CompletionCallback on_complete) = 0;
};

}  // namespace stagehand::presentation

#endif  // STAGEHAND_PRESENTATION_IPRESENTATION_LOADER_H_
