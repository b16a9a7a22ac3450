#pragma once

#include <vector>

#include "decision/decision_engine.hpp"
#include "model/runtime_records.hpp"
#include "model/telemetry_snapshot.hpp"

namespace edge_twin::core {

// Everything one scan produces; committed as a unit.
struct CycleRecord {
  model::TelemetrySnapshot snapshot{};
  decision::DecisionPayload decision{};
  double optimization_score{0.0};
  std::vector<model::RuntimeHealthMetric> health{};
  model::PowerAction power{};
};

}  // namespace edge_twin::core
