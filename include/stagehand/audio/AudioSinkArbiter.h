// Repository: Stagehand
// Component: AudioSinkArbiter
// Purpose: Enforces exactly one enabled audio sink across all loaded contexts.
// Copyright (c) 2025 Stagehand

#ifndef STAGEHAND_AUDIO_AUDIO_SINK_ARBITER_H_
#define STAGEHAND_AUDIO_AUDIO_SINK_ARBITER_H_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "stagehand/audio/IAudioSink.h"

namespace stagehand::audio {

// Which priority rule produced the winner of a pass.
enum class SelectionRule {
  kNone,              // No winner (fallback creation disabled or failed)
  kMainOutput,        // Sink on the designated main output node
  kPreferredContext,  // Enabled sink in the preferred context
  kAnyContext,        // Enabled sink in any loaded context
  kFallbackCreated,   // Dedicated fallback created this pass
  kFallbackReused,    // Previously created fallback re-enabled
};

const char* SelectionRuleToString(SelectionRule rule);

// Snapshot of one sink taken at the start of a pass. Candidates are never
// cached across passes.
struct AudioSinkCandidate {
  std::shared_ptr<IAudioSink> sink;
  std::string context_name;
  bool active_in_hierarchy = false;
  bool enabled = false;
  bool on_main_output = false;
};

struct ArbitrationResult {
  SelectionRule rule = SelectionRule::kNone;
  std::shared_ptr<IAudioSink> winner;
  std::size_t candidate_count = 0;
  std::size_t disabled_count = 0;
  bool winner_enabled = false;  // Winner was disabled and got force-enabled

  // True when the pass changed nothing.
  [[nodiscard]] bool IsNoOp() const {
    return disabled_count == 0 && !winner_enabled &&
           rule != SelectionRule::kFallbackCreated;
  }
};

struct ArbiterConfig {
  std::string main_output_node = "MainCamera";
  bool create_fallback_sink = true;
  std::string fallback_sink_name = "StagehandFallbackAudioSink";
};

// AudioSinkArbiter picks one live sink by priority, first match wins:
//   1. A reachable sink on the main output node (enabled or not).
//   2. An enabled reachable sink in the preferred context.
//   3. An enabled reachable sink in any loaded context (enumeration order).
//   4. The fallback sink: created once, re-enabled on later passes.
//
// The winner is force-enabled; every other enabled reachable sink is
// force-disabled. Unreachable sinks are never selected and never touched.
// A pass over an already-settled set changes nothing, so it is safe to run
// redundantly and on a timer.
//
// Not thread-safe. Driven from the tick thread.
class AudioSinkArbiter {
 public:
  struct Stats {
    uint64_t passes_total = 0;
    uint64_t sinks_disabled_total = 0;
    uint64_t sinks_enabled_total = 0;
    uint64_t fallback_created_total = 0;
    SelectionRule last_rule = SelectionRule::kNone;
    std::string last_winner;
  };

  // source must outlive the arbiter.
  AudioSinkArbiter(IAudioSinkSource* source, ArbiterConfig config);

  AudioSinkArbiter(const AudioSinkArbiter&) = delete;
  AudioSinkArbiter& operator=(const AudioSinkArbiter&) = delete;

  ArbitrationResult Arbitrate(const std::string& preferred_context);

  [[nodiscard]] bool HasFallback() const { return fallback_ != nullptr; }
  [[nodiscard]] std::shared_ptr<IAudioSink> fallback() const { return fallback_; }
  [[nodiscard]] const Stats& stats() const { return stats_; }
  [[nodiscard]] const ArbiterConfig& config() const { return config_; }

 private:
  std::vector<AudioSinkCandidate> CollectCandidates() const;
  std::shared_ptr<IAudioSink> SelectWinner(
      const std::vector<AudioSinkCandidate>& candidates,
      const std::string& preferred_context,
      SelectionRule* rule);
  void Enforce(const std::vector<AudioSinkCandidate>& candidates,
               ArbitrationResult& result);

  IAudioSinkSource* source_;
  ArbiterConfig config_;

  // Created at most once, reused for every later pass.
  std::shared_ptr<IAudioSink> fallback_;

  Stats stats_;
};

}  // namespace stagehand::audio

#endif  // STAGEHAND_AUDIO_AUDIO_SINK_ARBITER_H_
