// Repository: Stagehand
// Component: CoordinatorConfig
// Purpose: Names, policies and intervals for one ViewCoordinator instance.
// Copyright (c) 2025 Stagehand

#ifndef STAGEHAND_RUNTIME_COORDINATOR_CONFIG_H_
#define STAGEHAND_RUNTIME_COORDINATOR_CONFIG_H_

#include <cstdint>
#include <optional>
#include <string>

#include "stagehand/audio/AudioSinkArbiter.h"

namespace stagehand::runtime {

// CoordinatorConfig is fixed for the lifetime of a coordinator.
//
// JSON form (every field optional, defaults below):
//   {
//     "overlay_presentation": "Validator",
//     "primary_context": "MainScene",
//     "main_output_node": "MainCamera",
//     "arbitration_interval_ms": 1000,
//     "create_fallback_sink": true,
//     "fallback_sink_name": "StagehandFallbackAudioSink",
//     "verbose_logging": true
//   }
struct CoordinatorConfig {
  // Presentation loaded additively for the overlay view. Its loaded context
  // carries the same name.
  std::string overlay_presentation = "Validator";

  // Context that hosts the primary view and, normally, the simulation process.
  std::string primary_context = "MainScene";

  // Node whose audio sink wins arbitration whenever it is reachable.
  std::string main_output_node = "MainCamera";

  int64_t arbitration_interval_ms = 1000;
  bool create_fallback_sink = true;
  std::string fallback_sink_name = "StagehandFallbackAudioSink";

  // When false, transition chatter goes to Logger::Debug instead of Info.
  bool verbose_logging = true;

  // Returns empty optional on parse/validation failure.
  static std::optional<CoordinatorConfig> FromJson(const std::string& json_str);

  // Reads and parses a JSON file. Returns empty optional if the file cannot
  // be read or does not parse.
  static std::optional<CoordinatorConfig> FromFile(const std::string& path);

  std::string ToJson() const;

  bool IsValid() const;

  audio::ArbiterConfig ToArbiterConfig() const;
};

}  // namespace stagehand::runtime

#endif  // STAGEHAND_RUNTIME_COORDINATOR_CONFIG_H_
