#pragma once

#include <vector>

#include "decision/decision_engine.hpp"
#include "model/runtime_records.hpp"
#include "model/telemetry_snapshot.hpp"

namespace edge_twin::health {

inline constexpr double kFaultPenalty = 25.0;
inline constexpr double kFaultResiliencePenalty = 35.0;

// Composite 5..100 score; higher is better.
double optimization_score(const model::TelemetrySnapshot& snapshot) noexcept;

// CPU Headroom, Memory Headroom, Grid Resilience, Power Health and
// Decision Stability, in that order.
std::vector<model::RuntimeHealthMetric> build_runtime_health(const model::TelemetrySnapshot& snapshot,
                                                             const decision::DecisionPayload& decision);

}  // namespace edge_twin::health
