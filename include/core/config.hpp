#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "model/telemetry_snapshot.hpp"
#include "optimization/load_optimizer.hpp"
#include "power/power_profile.hpp"

namespace edge_twin::core {

struct RedisConfig {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string key_prefix{"edge:twin"};
  bool enabled{false};
};

struct TelemetryConfig {
  std::string disk_path{"/"};
  // Empty disables the out-of-process fallback.
  std::string query_command{};
  std::chrono::milliseconds query_timeout{8000};
};

struct RuntimeConfig {
  std::chrono::milliseconds scan_interval{5000};
  model::RuntimeMode mode{model::RuntimeMode::LIVE_EDGE};
  std::uint64_t simulation_seed{0x5eed};
  TelemetryConfig telemetry{};
  optimization::OptimizationPolicy optimization{};
  power::PowerControlOptions power{};
  bool stdout_debug{true};
  bool control_stdio{false};
  RedisConfig redis{};
};

RuntimeConfig load_runtime_config(const std::string& path);

}  // namespace edge_twin::core
