// Repository: Stagehand
// Component: IOverlayControlSurface Interface
// Purpose: Command surface exposed by the loaded overlay presentation.
// Copyright (c) 2025 Stagehand

#ifndef STAGEHAND_PRESENTATION_IOVERLAY_CONTROL_SURFACE_H_
#define STAGEHAND_PRESENTATION_IOVERLAY_CONTROL_SURFACE_H_

namespace stagehand::presentation {

// The overlay registers its control surface with the coordinator during its
// own initialization. The overlay owns the object; the coordinator holds a
// weak reference and drops it when the overlay unloads.
class IOverlayControlSurface {
 public:
  virtual ~IOverlayControlSurface() = default;

  // Opens the selector if closed, closes it if open.
  virtual void ToggleSelector() = 0;
};

}  // namespace stagehand::presentation

#endif  // STAGEHAND_PRESENTATION_IOVERLAY_CONTROL_SURFACE_H_
