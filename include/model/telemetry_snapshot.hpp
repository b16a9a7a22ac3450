#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace edge_twin::model {

enum class RuntimeMode : std::uint8_t {
  LIVE_EDGE = 0,
  SIMULATION = 1,
  HYBRID = 2,
};

enum class Scenario : std::uint8_t {
  NORMAL = 0,
  PEAK_LOAD = 1,
  LOW_LOAD = 2,
  GRID_FAILURE = 3,
};

const char* to_string(RuntimeMode mode) noexcept;
const char* to_string(Scenario scenario) noexcept;

// Case-insensitive, surrounding whitespace ignored.
std::optional<RuntimeMode> parse_runtime_mode(std::string_view text);
std::optional<Scenario> parse_scenario(std::string_view text);

struct IndustrialMetrics {
  std::string site_id{};
  double energy_usage_kwh{0.0};
  double thermal_index_c{0.0};
  // Fraction in [0.05, 0.99].
  double grid_load{0.0};
};

// One cycle's consolidated reading. Percentages are in [0, 100].
struct TelemetrySnapshot {
  std::uint64_t timestamp_ms{0};
  std::string hostname{};
  std::string platform{};

  double cpu_percent{0.0};
  double memory_percent{0.0};
  double disk_percent{0.0};
  std::optional<double> battery_percent{};
  std::optional<bool> power_plugged{};
  std::uint32_t process_count{0};

  bool fault_flag{false};
  // Empty when the producing source has no view of the grid.
  std::string grid_status{};

  RuntimeMode scan_mode{RuntimeMode::LIVE_EDGE};
  Scenario scenario{Scenario::NORMAL};
  IndustrialMetrics industrial{};
};

}  // namespace edge_twin::model
