// Repository: Stagehand
// Component: IAudioSink Interface
// Purpose: Host-side audio output endpoint and its enumeration source.
// Copyright (c) 2025 Stagehand

#ifndef STAGEHAND_AUDIO_IAUDIO_SINK_H_
#define STAGEHAND_AUDIO_IAUDIO_SINK_H_

#include <memory>
#include <string>
#include <vector>

namespace stagehand::audio {

// IAudioSink is an endpoint that receives the application's audio output.
// Any presentation context may carry one or more; exactly one may be live.
//
// IAudioSink explicitly does NOT:
// - Decide whether it should be the live sink (AudioSinkArbiter does)
// - Know about view states or transitions
class IAudioSink {
 public:
  virtual ~IAudioSink() = default;

  // Human-readable name (for logging/diagnostics).
  virtual std::string GetName() const = 0;

  // Presentation context the sink belongs to.
  virtual std::string GetContextName() const = 0;

  // Name of the node the sink is attached to. Compared against the
  // configured main output node.
  virtual std::string GetNodeName() const = 0;

  // False when the sink or any ancestor is inactive; such a sink can never
  // carry output and the arbiter leaves it alone.
  virtual bool IsActiveInHierarchy() const = 0;

  virtual bool IsEnabled() const = 0;
  virtual void SetEnabled(bool enabled) = 0;
};

// IAudioSinkSource enumerates sinks across every currently loaded context.
class IAudioSinkSource {
 public:
  virtual ~IAudioSinkSource() = default;

  // Fresh enumeration on every call. Order must be stable for an unchanged
  // set of loaded contexts.
  virtual std::vector<std::shared_ptr<IAudioSink>> EnumerateSinks() const = 0;

  // Creates a sink parented under the coordinator's persistent node so it
  // survives every transition. Returns nullptr on failure.
  virtual std::shared_ptr<IAudioSink> CreateFallbackSink(const std::string& name) = 0;
};

}  // namespace stagehand::audio

#endif  // STAGEHAND_AUDIO_IAUDIO_SINK_H_
