#include "power/power_profile.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <utility>

namespace edge_twin::power {
namespace {

const char* backend_binary(const PowerBackend backend) noexcept {
  return backend == PowerBackend::POWERCFG ? "powercfg" : "powerprofilesctl";
}

std::string trim(std::string value) {
  const auto first = value.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return {};
  }
  const auto last = value.find_last_not_of(" \t\r\n");
  return value.substr(first, last - first + 1);
}

}  // namespace

const char* to_string(const PowerBackend backend) noexcept { return backend_binary(backend); }

std::optional<PowerBackend> parse_power_backend(const std::string_view text) {
  std::string lowered = trim(std::string(text));
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lowered == "powerprofilesctl") {
    return PowerBackend::POWERPROFILESCTL;
  }
  if (lowered == "powercfg") {
    return PowerBackend::POWERCFG;
  }
  return std::nullopt;
}

PowerProfileController::PowerProfileController(PowerControlOptions options)
    : PowerProfileController(options, core::run_command, core::command_on_path(backend_binary(options.backend))) {}

PowerProfileController::PowerProfileController(PowerControlOptions options, core::CommandRunner runner,
                                               const bool platform_supported)
    : options_(std::move(options)),
      runner_(std::move(runner)),
      platform_supported_(platform_supported),
      auto_apply_(options_.auto_apply) {}

model::PowerProfile PowerProfileController::pick_profile(const model::TelemetrySnapshot& snapshot) noexcept {
  if (snapshot.fault_flag) {
    return model::PowerProfile::HIGH_PERFORMANCE;
  }

  const bool plugged = snapshot.power_plugged.value_or(false);
  if (snapshot.battery_percent.has_value() && !plugged && *snapshot.battery_percent <= 25.0) {
    return model::PowerProfile::POWER_SAVER;
  }
  if (plugged && snapshot.cpu_percent >= 85.0) {
    return model::PowerProfile::HIGH_PERFORMANCE;
  }
  return model::PowerProfile::BALANCED;
}

std::vector<std::string> PowerProfileController::command_for(const model::PowerProfile profile) const {
  if (options_.backend == PowerBackend::POWERCFG) {
    const char* scheme = "SCHEME_BALANCED";
    if (profile == model::PowerProfile::POWER_SAVER) {
      scheme = "SCHEME_MAX";
    } else if (profile == model::PowerProfile::HIGH_PERFORMANCE) {
      scheme = "SCHEME_MIN";
    }
    return {"powercfg", "/SETACTIVE", scheme};
  }

  const char* scheme = "balanced";
  if (profile == model::PowerProfile::POWER_SAVER) {
    scheme = "power-saver";
  } else if (profile == model::PowerProfile::HIGH_PERFORMANCE) {
    scheme = "performance";
  }
  return {"powerprofilesctl", "set", scheme};
}

model::PowerAction PowerProfileController::apply(const model::PowerProfile profile) {
  model::PowerAction action{};
  action.requested = profile;

  if (!auto_apply()) {
    action.reason = "auto_apply_disabled";
    return action;
  }
  if (!platform_supported_ || !runner_) {
    action.reason = "unsupported_platform";
    return action;
  }

  // Cooldown check, backend call and record form one step.
  std::lock_guard<std::mutex> lock(mutex_);
  const auto now = std::chrono::steady_clock::now();
  if (last_applied_ == profile && now - last_applied_at_ < options_.cooldown) {
    action.reason = "cooldown";
    return action;
  }

  const core::CommandResult result = runner_(command_for(profile), options_.timeout);
  if (!result.ok()) {
    const std::string err = trim(result.err);
    action.reason = err.empty() ? "power_command_failed" : err;
    std::cerr << "[power] " << model::to_string(profile) << " not applied: " << action.reason << '\n';
    return action;
  }

  last_applied_ = profile;
  last_applied_at_ = std::chrono::steady_clock::now();
  action.applied = true;
  return action;
}

}  // namespace edge_twin::power
