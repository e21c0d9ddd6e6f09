// Repository: Stagehand
// Component: IViewContainer Interface
// Purpose: Visibility handle for the primary view container.
// Copyright (c) 2025 Stagehand

#ifndef STAGEHAND_PRESENTATION_IVIEW_CONTAINER_H_
#define STAGEHAND_PRESENTATION_IVIEW_CONTAINER_H_

#include <string>

namespace stagehand::presentation {

// Owned exclusively by the coordinator while wired; no other component
// should toggle it.
class IViewContainer {
 public:
  virtual ~IViewContainer() = default;

  virtual std::string GetName() const = 0;
  virtual bool IsVisible() const = 0;
  virtual void SetVisible(bool visible) = 0;
};

}  // namespace stagehand::presentation

#endif  // STAGEHAND_PRESENTATION_IVIEW_CONTAINER_H_
