#include "telemetry/simulator.hpp"

#include <algorithm>

#include "core/math.hpp"
#include "core/timestamp.hpp"

namespace edge_twin::telemetry {

SimulatedTelemetry::SimulatedTelemetry(const std::uint64_t seed) : rng_(seed) {}

double SimulatedTelemetry::walk(const double value, const double delta, const double low, const double high) {
  std::uniform_real_distribution<double> step(-delta, delta);
  return std::clamp(value + step(rng_), low, high);
}

bool SimulatedTelemetry::chance(const double probability) {
  std::uniform_real_distribution<double> roll(0.0, 1.0);
  return roll(rng_) < probability;
}

model::TelemetrySnapshot SimulatedTelemetry::collect() {
  state_.cpu_percent = walk(state_.cpu_percent, 7.0, 8.0, 96.0);
  state_.memory_percent = walk(state_.memory_percent, 4.0, 20.0, 96.0);
  state_.disk_percent = walk(state_.disk_percent, 1.2, 20.0, 98.0);

  std::uniform_int_distribution<int> process_step(-8, 12);
  const int processes = static_cast<int>(state_.process_count) + process_step(rng_);
  state_.process_count = static_cast<std::uint32_t>(std::clamp(processes, 40, 600));

  if (state_.power_plugged) {
    std::uniform_real_distribution<double> charge(0.1, 0.7);
    state_.battery_percent = std::min(100.0, state_.battery_percent + charge(rng_));
    if (state_.battery_percent >= 96.0 && chance(0.2)) {
      state_.power_plugged = false;
    }
  } else {
    std::uniform_real_distribution<double> drain(0.2, 0.9);
    state_.battery_percent = std::max(8.0, state_.battery_percent - drain(rng_));
    if (state_.battery_percent <= 18.0 && chance(0.35)) {
      state_.power_plugged = true;
    }
  }
  state_.battery_percent = core::round2(state_.battery_percent);

  model::TelemetrySnapshot snapshot{};
  snapshot.timestamp_ms = core::unix_timestamp_now_ms();
  snapshot.hostname = "digital-twin-edge";
  snapshot.platform = "Industrial Digital Twin";
  snapshot.cpu_percent = core::round2(state_.cpu_percent);
  snapshot.memory_percent = core::round2(state_.memory_percent);
  snapshot.disk_percent = core::round2(state_.disk_percent);
  snapshot.battery_percent = state_.battery_percent;
  snapshot.power_plugged = state_.power_plugged;
  snapshot.process_count = state_.process_count;
  snapshot.fault_flag = false;
  snapshot.grid_status = "healthy";
  snapshot.scan_mode = model::RuntimeMode::SIMULATION;
  return snapshot;
}

}  // namespace edge_twin::telemetry
