#include <algorithm>
#include <cctype>
#include <string>

#include "model/runtime_records.hpp"
#include "model/telemetry_snapshot.hpp"

namespace edge_twin::model {
namespace {

std::string normalize(std::string_view text, const bool upper) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) {
    text.remove_prefix(1);
  }
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
    text.remove_suffix(1);
  }

  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(), [upper](unsigned char c) {
    return static_cast<char>(upper ? std::toupper(c) : std::tolower(c));
  });
  return out;
}

}  // namespace

const char* to_string(const RuntimeMode mode) noexcept {
  switch (mode) {
    case RuntimeMode::LIVE_EDGE:
      return "LIVE_EDGE";
    case RuntimeMode::SIMULATION:
      return "SIMULATION";
    case RuntimeMode::HYBRID:
      return "HYBRID";
  }
  return "LIVE_EDGE";
}

const char* to_string(const Scenario scenario) noexcept {
  switch (scenario) {
    case Scenario::NORMAL:
      return "normal";
    case Scenario::PEAK_LOAD:
      return "peak_load";
    case Scenario::LOW_LOAD:
      return "low_load";
    case Scenario::GRID_FAILURE:
      return "grid_failure";
  }
  return "normal";
}

std::optional<RuntimeMode> parse_runtime_mode(const std::string_view text) {
  const std::string normalized = normalize(text, true);
  for (const RuntimeMode mode : {RuntimeMode::LIVE_EDGE, RuntimeMode::SIMULATION, RuntimeMode::HYBRID}) {
    if (normalized == to_string(mode)) {
      return mode;
    }
  }
  return std::nullopt;
}

std::optional<Scenario> parse_scenario(const std::string_view text) {
  const std::string normalized = normalize(text, false);
  for (const Scenario scenario : {Scenario::NORMAL, Scenario::PEAK_LOAD, Scenario::LOW_LOAD, Scenario::GRID_FAILURE}) {
    if (normalized == to_string(scenario)) {
      return scenario;
    }
  }
  return std::nullopt;
}

const char* to_string(const EventType type) noexcept {
  switch (type) {
    case EventType::INFO:
      return "INFO";
    case EventType::WARN:
      return "WARN";
    case EventType::ERROR:
      return "ERROR";
    case EventType::SUCCESS:
      return "SUCCESS";
  }
  return "INFO";
}

const char* to_string(const AlertSeverity severity) noexcept {
  return severity == AlertSeverity::CRITICAL ? "critical" : "warning";
}

const char* to_string(const PowerProfile profile) noexcept {
  switch (profile) {
    case PowerProfile::POWER_SAVER:
      return "power_saver";
    case PowerProfile::BALANCED:
      return "balanced";
    case PowerProfile::HIGH_PERFORMANCE:
      return "high_performance";
  }
  return "balanced";
}

}  // namespace edge_twin::model
