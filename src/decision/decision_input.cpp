#include "decision/decision_input.hpp"

#include <algorithm>

#include "core/math.hpp"
#include "core/timestamp.hpp"

namespace edge_twin::decision {

DecisionInput to_decision_input(const model::TelemetrySnapshot& snapshot) {
  const auto slot = core::utc_calendar_slot(snapshot.timestamp_ms);

  DecisionInput input{};
  input.building_id = 1;
  input.temperature = core::round2(snapshot.industrial.thermal_index_c);
  input.humidity = core::round2(std::clamp(35.0 + snapshot.memory_percent * 0.35, 30.0, 85.0));
  input.occupancy = std::max<std::uint32_t>(1, snapshot.process_count);
  input.day_of_week = slot.day_of_week;
  input.hour = slot.hour;
  input.current_load = core::round2(snapshot.industrial.grid_load * 100.0);
  input.energy_usage_kwh = snapshot.industrial.energy_usage_kwh;
  input.location = snapshot.industrial.site_id.empty() ? snapshot.hostname : snapshot.industrial.site_id;
  input.fault_flag = snapshot.fault_flag;
  input.grid_status = snapshot.grid_status.empty() ? "healthy" : snapshot.grid_status;

  if (input.fault_flag || input.grid_status == "down") {
    input.state = "grid_failure";
  } else if (snapshot.cpu_percent >= 85.0) {
    input.state = "high_load";
  } else {
    input.state = "normal";
  }
  return input;
}

}  // namespace edge_twin::decision
