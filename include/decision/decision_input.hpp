#pragma once

#include <cstdint>
#include <string>

#include "model/telemetry_snapshot.hpp"

namespace edge_twin::decision {

// What the decision function consumes; a pure projection of a snapshot.
struct DecisionInput {
  int building_id{1};
  double temperature{0.0};
  double humidity{0.0};
  std::uint32_t occupancy{1};
  int day_of_week{0};
  int hour{0};
  double current_load{0.0};
  double energy_usage_kwh{0.0};
  std::string state{"normal"};
  std::string location{};
  bool fault_flag{false};
  std::string grid_status{};
};

DecisionInput to_decision_input(const model::TelemetrySnapshot& snapshot);

}  // namespace edge_twin::decision
