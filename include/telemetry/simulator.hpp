#pragma once

#include <cstdint>
#include <random>

#include "model/telemetry_snapshot.hpp"

namespace edge_twin::telemetry {

// Bounded random walk standing in for a plant-side digital twin. Owns its
// generator so a fixed seed replays the same trajectory.
class SimulatedTelemetry {
 public:
  struct State {
    double cpu_percent{38.0};
    double memory_percent{52.0};
    double disk_percent{48.0};
    double battery_percent{78.0};
    bool power_plugged{false};
    std::uint32_t process_count{190};
  };

  explicit SimulatedTelemetry(std::uint64_t seed);

  model::TelemetrySnapshot collect();
  const State& state() const noexcept { return state_; }

 private:
  double walk(double value, double delta, double low, double high);
  bool chance(double probability);

  std::mt19937_64 rng_;
  State state_{};
};

}  // namespace edge_twin::telemetry
