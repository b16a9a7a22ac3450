#include "health/health_scorer.hpp"

#include <algorithm>

#include "core/math.hpp"

namespace edge_twin::health {

double optimization_score(const model::TelemetrySnapshot& snapshot) noexcept {
  const double battery_penalty =
      snapshot.battery_percent.has_value() ? std::max(0.0, 100.0 - *snapshot.battery_percent) : 0.0;
  const double fault_penalty = snapshot.fault_flag ? kFaultPenalty : 0.0;

  const double score = 100.0 - (snapshot.cpu_percent * 0.3 + snapshot.memory_percent * 0.25 +
                                snapshot.disk_percent * 0.1 + snapshot.industrial.grid_load * 100.0 * 0.25 +
                                battery_penalty * 0.1 + fault_penalty);
  return core::round2(std::clamp(score, 5.0, 100.0));
}

std::vector<model::RuntimeHealthMetric> build_runtime_health(const model::TelemetrySnapshot& snapshot,
                                                             const decision::DecisionPayload& decision) {
  double grid_resilience = core::clamp_percent(100.0 - snapshot.industrial.grid_load * 100.0);
  if (snapshot.fault_flag) {
    grid_resilience = std::max(0.0, grid_resilience - kFaultResiliencePenalty);
  }

  const double power_health = snapshot.battery_percent.value_or(100.0);
  const double stability = decision::stability_score(decision) * 100.0;

  return {
      {"CPU Headroom", core::round2(core::clamp_percent(100.0 - snapshot.cpu_percent))},
      {"Memory Headroom", core::round2(core::clamp_percent(100.0 - snapshot.memory_percent))},
      {"Grid Resilience", core::round2(grid_resilience)},
      {"Power Health", core::round2(core::clamp_percent(power_health))},
      {"Decision Stability", core::round2(core::clamp_percent(stability))},
  };
}

}  // namespace edge_twin::health
