#pragma once

#include "model/telemetry_snapshot.hpp"

namespace edge_twin::telemetry {

inline constexpr double kEdgeBlendWeight = 0.65;

// Weighted merge of a live reading and a simulated one. Optional fields prefer
// the live value; the fault flag is the OR of both.
model::TelemetrySnapshot blend(const model::TelemetrySnapshot& edge, const model::TelemetrySnapshot& simulated,
                               double edge_weight = kEdgeBlendWeight);

}  // namespace edge_twin::telemetry
