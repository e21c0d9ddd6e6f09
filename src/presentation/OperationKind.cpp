// Repository: Stagehand
// Component: IPresentationLoader Interface
// Purpose: String conversion for loader operation kinds.
// Copyright (c) 2025 Stagehand

#include "stagehand/presentation/IPresentationLoader.h"

namespace stagehand::presentation {

const char* OperationKindToString(OperationKind kind) {
  switch (kind) {
    case OperationKind::kLoad:
      return "load";
    case OperationKind::kUnload:
      return "unload";
  }
  return "unknown";
}

}  // namespace stagehand::presentation
