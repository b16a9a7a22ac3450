#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/process.hpp"
#include "model/runtime_records.hpp"
#include "model/telemetry_snapshot.hpp"

namespace edge_twin::power {

enum class PowerBackend : std::uint8_t {
  POWERPROFILESCTL = 0,  // powerprofilesctl set <power-saver|balanced|performance>
  POWERCFG = 1,          // powercfg /SETACTIVE <SCHEME_MAX|SCHEME_BALANCED|SCHEME_MIN>
};

const char* to_string(PowerBackend backend) noexcept;
std::optional<PowerBackend> parse_power_backend(std::string_view text);

struct PowerControlOptions {
  PowerBackend backend{PowerBackend::POWERPROFILESCTL};
  std::chrono::seconds cooldown{120};
  std::chrono::milliseconds timeout{8000};
  bool auto_apply{true};
};

class PowerProfileController {
 public:
  // Supported when the backend binary resolves on PATH.
  explicit PowerProfileController(PowerControlOptions options);
  PowerProfileController(PowerControlOptions options, core::CommandRunner runner, bool platform_supported);

  static model::PowerProfile pick_profile(const model::TelemetrySnapshot& snapshot) noexcept;

  // Never throws; every refusal or backend failure is a not-applied action.
  model::PowerAction apply(model::PowerProfile profile);

  std::vector<std::string> command_for(model::PowerProfile profile) const;

  void set_auto_apply(bool enabled) noexcept { auto_apply_.store(enabled); }
  bool auto_apply() const noexcept { return auto_apply_.load(); }
  bool platform_supported() const noexcept { return platform_supported_; }

 private:
  PowerControlOptions options_;
  core::CommandRunner runner_;
  bool platform_supported_{false};
  std::atomic<bool> auto_apply_{true};

  std::mutex mutex_;
  std::optional<model::PowerProfile> last_applied_{};
  std::chrono::steady_clock::time_point last_applied_at_{};
};

}  // namespace edge_twin::power
