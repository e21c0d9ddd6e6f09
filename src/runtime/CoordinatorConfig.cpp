// Repository: Stagehand
// Component: CoordinatorConfig
// Purpose: Parse and validate CoordinatorConfig from JSON.
// Copyright (c) 2025 Stagehand

#include "stagehand/runtime/CoordinatorConfig.h"

#include <fstream>
#include <regex>
#include <sstream>

namespace stagehand::runtime {

namespace {
  // The schema is flat and fixed, so fields are pulled out with regexes
  // rather than a JSON dependency. Missing fields keep their defaults;
  // present-but-malformed fields fail the parse. Strings may be empty and
  // carry the usual backslash escapes.

  enum class Extract { kAbsent, kOk, kMalformed };

  // Inverse of EscapeJson. Input is the body of a quoted JSON string.
  std::string UnescapeJson(const std::string& body) {
    std::string out;
    out.reserve(body.size());
    for (std::size_t i = 0; i < body.size(); ++i) {
      if (body[i] != '\\' || i + 1 == body.size()) {
        out += body[i];
        continue;
      }
      const char escaped = body[++i];
      switch (escaped) {
        case 'n': out += '\n'; break;
        case 't': out += '\t'; break;
        case 'r': out += '\r'; break;
        case 'b': out += '\b'; break;
        case 'f': out += '\f'; break;
        default: out += escaped; break;  // \" \\ \/
      }
    }
    return out;
  }

  std::string EscapeJson(const std::string& value) {
    std::string out;
    out.reserve(value.size() + 2);
    for (const char c : value) {
      switch (c) {
        case '"': out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n"; break;
        case '\t': out += "\\t"; break;
        case '\r': out += "\\r"; break;
        default: out += c; break;
      }
    }
    return out;
  }

  Extract ExtractInt64(const std::string& json, const std::string& field_name, int64_t& out_value) {
    std::regex present("\"" + field_name + "\"\\s*:");
    if (!std::regex_search(json, present)) {
      return Extract::kAbsent;
    }
    std::regex pattern("\"" + field_name + "\"\\s*:\\s*(-?\\d+)");
    std::smatch match;
    if (!std::regex_search(json, match, pattern)) {
      return Extract::kMalformed;
    }
    try {
      out_value = std::stoll(match[1].str());
      return Extract::kOk;
    } catch (const std::exception&) {
      return Extract::kMalformed;
    }
  }

  Extract ExtractBool(const std::string& json, const std::string& field_name, bool& out_value) {
    std::regex present("\"" + field_name + "\"\\s*:");
    if (!std::regex_search(json, present)) {
      return Extract::kAbsent;
    }
    std::regex pattern("\"" + field_name + "\"\\s*:\\s*(true|false)");
    std::smatch match;
    if (!std::regex_search(json, match, pattern)) {
      return Extract::kMalformed;
    }
    out_value = match[1].str() == "true";
    return Extract::kOk;
  }

  Extract ExtractString(const std::string& json, const std::string& field_name, std::string& out_value) {
    std::regex present("\"" + field_name + "\"\\s*:");
    if (!std::regex_search(json, present)) {
      return Extract::kAbsent;
    }
    std::regex pattern("\"" + field_name + "\"\\s*:\\s*\"((?:[^\"\\\\]|\\\\.)*)\"");
    std::smatch match;
    if (!std::regex_search(json, match, pattern)) {
      return Extract::kMalformed;
    }
    out_value = UnescapeJson(match[1].str());
    return Extract::kOk;
  }

  bool LooksLikeObject(const std::string& json) {
    const auto first = json.find_first_not_of(" \t\r\n");
    const auto last = json.find_last_not_of(" \t\r\n");
    return first != std::string::npos && json[first] == '{' && json[last] == '}';
  }
}

std::optional<CoordinatorConfig> CoordinatorConfig::FromJson(const std::string& json_str) {
  if (!LooksLikeObject(json_str)) {
    return std::nullopt;
  }

  CoordinatorConfig config;

  if (ExtractString(json_str, "overlay_presentation", config.overlay_presentation) == Extract::kMalformed) {
    return std::nullopt;
  }
  if (ExtractString(json_str, "primary_context", config.primary_context) == Extract::kMalformed) {
    return std::nullopt;
  }
  if (ExtractString(json_str, "main_output_node", config.main_output_node) == Extract::kMalformed) {
    return std::nullopt;
  }
  if (ExtractInt64(json_str, "arbitration_interval_ms", config.arbitration_interval_ms) == Extract::kMalformed) {
    return std::nullopt;
  }
  if (ExtractBool(json_str, "create_fallback_sink", config.create_fallback_sink) == Extract::kMalformed) {
    return std::nullopt;
  }
  if (ExtractString(json_str, "fallback_sink_name", config.fallback_sink_name) == Extract::kMalformed) {
    return std::nullopt;
  }
  if (ExtractBool(json_str, "verbose_logging", config.verbose_logging) == Extract::kMalformed) {
    return std::nullopt;
  }

  if (!config.IsValid()) {
    return std::nullopt;
  }
  return config;
}

std::optional<CoordinatorConfig> CoordinatorConfig::FromFile(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return std::nullopt;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return FromJson(buffer.str());
}

std::string CoordinatorConfig::ToJson() const {
  std::ostringstream oss;
  oss << "{"
      << "\"overlay_presentation\":\"" << EscapeJson(overlay_presentation) << "\","
      << "\"primary_context\":\"" << EscapeJson(primary_context) << "\","
      << "\"main_output_node\":\"" << EscapeJson(main_output_node) << "\","
      << "\"arbitration_interval_ms\":" << arbitration_interval_ms << ","
      << "\"create_fallback_sink\":" << (create_fallback_sink ? "true" : "false") << ","
      << "\"fallback_sink_name\":\"" << EscapeJson(fallback_sink_name) << "\","
      << "\"verbose_logging\":" << (verbose_logging ? "true" : "false")
      << "}";
  return oss.str();
}

bool CoordinatorConfig::IsValid() const {
  if (overlay_presentation.empty() || primary_context.empty()) {
    return false;
  }
  if (overlay_presentation == primary_context) {
    return false;
  }
  if (arbitration_interval_ms <= 0) {
    return false;
  }
  if (create_fallback_sink && fallback_sink_name.empty()) {
    return false;
  }
  return true;
}

audio::ArbiterConfig CoordinatorConfig::ToArbiterConfig() const {
  audio::ArbiterConfig arbiter;
  arbiter.main_output_node = main_output_node;
  arbiter.create_fallback_sink = create_fallback_sink;
  arbiter.fallback_sink_name = fallback_sink_name;
  return arbiter;
}

}  // namespace stagehand::runtime
