#include "telemetry/blend.hpp"

#include <cmath>
#include <cstdint>
#include <string>

#include "core/math.hpp"
#include "core/timestamp.hpp"

namespace edge_twin::telemetry {
namespace {

double mix(const double edge, const double simulated, const double edge_weight) {
  return edge * edge_weight + simulated * (1.0 - edge_weight);
}

}  // namespace

model::TelemetrySnapshot blend(const model::TelemetrySnapshot& edge, const model::TelemetrySnapshot& simulated,
                               const double edge_weight) {
  model::TelemetrySnapshot out{};
  out.timestamp_ms = core::unix_timestamp_now_ms();
  out.hostname = edge.hostname.empty() ? simulated.hostname : edge.hostname;
  out.platform = "Hybrid (" + (edge.platform.empty() ? std::string("edge") : edge.platform) + " + simulation)";

  out.cpu_percent = core::round2(core::clamp_percent(mix(edge.cpu_percent, simulated.cpu_percent, edge_weight)));
  out.memory_percent =
      core::round2(core::clamp_percent(mix(edge.memory_percent, simulated.memory_percent, edge_weight)));
  out.disk_percent = core::round2(core::clamp_percent(mix(edge.disk_percent, simulated.disk_percent, edge_weight)));
  out.process_count = static_cast<std::uint32_t>(std::lround(
      mix(static_cast<double>(edge.process_count), static_cast<double>(simulated.process_count), edge_weight)));

  out.battery_percent = edge.battery_percent.has_value() ? edge.battery_percent : simulated.battery_percent;
  out.power_plugged = edge.power_plugged.has_value() ? edge.power_plugged : simulated.power_plugged;

  out.fault_flag = edge.fault_flag || simulated.fault_flag;
  if (!edge.grid_status.empty()) {
    out.grid_status = edge.grid_status;
  } else if (!simulated.grid_status.empty()) {
    out.grid_status = simulated.grid_status;
  } else {
    out.grid_status = "healthy";
  }

  out.scan_mode = model::RuntimeMode::HYBRID;
  return out;
}

}  // namespace edge_twin::telemetry
