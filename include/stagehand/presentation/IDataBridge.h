// Repository: Stagehand
// Component: IDataBridge Interface
// Purpose: Lets display widgets re-discover the persistent simulation process.
// Copyright (c) 2025 Stagehand

#ifndef STAGEHAND_PRESENTATION_IDATA_BRIDGE_H_
#define STAGEHAND_PRESENTATION_IDATA_BRIDGE_H_

namespace stagehand::presentation {

class IDataBridge {
 public:
  virtual ~IDataBridge() = default;

  // Called once per successful overlay load. The coordinator does not
  // inspect the outcome.
  virtual void ResolveSources() = 0;
};

}  // namespace stagehand::presentation

#endif  // STAGEHAND_PRESENTATION_IDATA_BRIDGE_H_
