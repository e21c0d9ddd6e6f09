// Repository: Stagehand
// Component: AudioSinkArbiter
// Purpose: Enforces exactly one enabled audio sink across all loaded contexts.
// Copyright (c) 2025 Stagehand

#include "stagehand/audio/AudioSinkArbiter.h"

#include <sstream>
#include <utility>

#include "stagehand/util/Logger.hpp"

namespace stagehand::audio {

using util::Logger;

const char* SelectionRuleToString(SelectionRule rule) {
  switch (rule) {
    case SelectionRule::kNone:
      return "none";
    case SelectionRule::kMainOutput:
      return "main_output";
    case SelectionRule::kPreferredContext:
      return "preferred_context";
    case SelectionRule::kAnyContext:
      return "any_context";
    case SelectionRule::kFallbackCreated:
      return "fallback_created";
    case SelectionRule::kFallbackReused:
      return "fallback_reused";
  }
  return "unknown";
}

AudioSinkArbiter::AudioSinkArbiter(IAudioSinkSource* source, ArbiterConfig config)
    : source_(source), config_(std::move(config)) {}

std::vector<AudioSinkCandidate> AudioSinkArbiter::CollectCandidates() const {
  std::vector<AudioSinkCandidate> candidates;
  if (!source_) {
    return candidates;
  }

  for (auto& sink : source_->EnumerateSinks()) {
    if (!sink) continue;
    AudioSinkCandidate candidate;
    candidate.context_name = sink->GetContextName();
    candidate.active_in_hierarchy = sink->IsActiveInHierarchy();
    candidate.enabled = sink->IsEnabled();
    candidate.on_main_output =
        !config_.main_output_node.empty() &&
        sink->GetNodeName() == config_.main_output_node;
    candidate.sink = std::move(sink);
    candidates.push_back(std::move(candidate));
  }
  return candidates;
}

std::shared_ptr<IAudioSink> AudioSinkArbiter::SelectWinner(
    const std::vector<AudioSinkCandidate>& candidates,
    const std::string& preferred_context,
    SelectionRule* rule) {
  for (const auto& c : candidates) {
    if (c.on_main_output && c.active_in_hierarchy) {
      *rule = SelectionRule::kMainOutput;
      return c.sink;
    }
  }

  for (const auto& c : candidates) {
    if (c.active_in_hierarchy && c.enabled && c.context_name == preferred_context) {
      *rule = SelectionRule::kPreferredContext;
      return c.sink;
    }
  }

  for (const auto& c : candidates) {
    if (c.active_in_hierarchy && c.enabled) {
      *rule = SelectionRule::kAnyContext;
      return c.sink;
    }
  }

  if (!config_.create_fallback_sink) {
    *rule = SelectionRule::kNone;
    return nullptr;
  }

  if (fallback_) {
    *rule = SelectionRule::kFallbackReused;
    return fallback_;
  }

  fallback_ = source_ ? source_->CreateFallbackSink(config_.fallback_sink_name)
                      : nullptr;
  if (!fallback_) {
    Logger::Error("[AudioSinkArbiter] Failed to create fallback sink '" +
                  config_.fallback_sink_name + "'; no audio output available");
    *rule = SelectionRule::kNone;
    return nullptr;
  }

  ++stats_.fallback_created_total;
  Logger::Info("[AudioSinkArbiter] No usable sink in any loaded context; created fallback '" +
               fallback_->GetName() + "'");
  *rule = SelectionRule::kFallbackCreated;
  return fallback_;
}

void AudioSinkArbiter::Enforce(const std::vector<AudioSinkCandidate>& candidates,
                               ArbitrationResult& result) {
  for (const auto& c : candidates) {
    if (c.sink == result.winner) continue;
    // Inactive sinks cannot carry output; leave them untouched.
    if (!c.active_in_hierarchy || !c.enabled) continue;
    c.sink->SetEnabled(false);
    ++result.disabled_count;
    Logger::Debug("[AudioSinkArbiter] Disabled '" + c.sink->GetName() +
                  "' in '" + c.context_name + "'");
  }

  if (result.winner && !result.winner->IsEnabled()) {
    result.winner->SetEnabled(true);
    result.winner_enabled = true;
  }
}

ArbitrationResult AudioSinkArbiter::Arbitrate(const std::string& preferred_context) {
  const auto candidates = CollectCandidates();

  ArbitrationResult result;
  result.candidate_count = candidates.size();
  result.winner = SelectWinner(candidates, preferred_context, &result.rule);

  Enforce(candidates, result);

  ++stats_.passes_total;
  stats_.sinks_disabled_total += result.disabled_count;
  if (result.winner_enabled) {
    ++stats_.sinks_enabled_total;
  }
  stats_.last_rule = result.rule;
  stats_.last_winner = result.winner ? result.winner->GetName() : std::string();

  std::ostringstream line;
  line << "[AudioSinkArbiter] rule=" << SelectionRuleToString(result.rule)
       << " winner=" << (result.winner ? result.winner->GetName() : "<none>")
       << " preferred=" << preferred_context
       << " candidates=" << result.candidate_count
       << " disabled=" << result.disabled_count
       << " enabled_winner=" << (result.winner_enabled ? "yes" : "no");
  if (result.IsNoOp()) {
    Logger::Debug(line.str());
  } else {
    Logger::Info(line.str());
  }
  return result;
}

}  // namespace stagehand::audio
