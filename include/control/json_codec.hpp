#pragma once

#include <nlohmann/json.hpp>

#include "core/runtime.hpp"
#include "decision/decision_engine.hpp"
#include "model/runtime_records.hpp"
#include "model/telemetry_snapshot.hpp"
#include "optimization/load_optimizer.hpp"

// Declared beside each type so nlohmann::json finds them by ADL.

namespace edge_twin::model {

void to_json(nlohmann::json& out, const IndustrialMetrics& metrics);
void to_json(nlohmann::json& out, const TelemetrySnapshot& snapshot);
void to_json(nlohmann::json& out, const Event& event);
void to_json(nlohmann::json& out, const Alert& alert);
void to_json(nlohmann::json& out, const HistoryRecord& record);
void to_json(nlohmann::json& out, const RuntimeHealthMetric& metric);
void to_json(nlohmann::json& out, const PowerAction& action);

}  // namespace edge_twin::model

namespace edge_twin::optimization {

void to_json(nlohmann::json& out, const OptimizationResult& result);

}  // namespace edge_twin::optimization

namespace edge_twin::decision {

void to_json(nlohmann::json& out, const DecisionPayload& decision);

}  // namespace edge_twin::decision

namespace edge_twin::core {

void to_json(nlohmann::json& out, const HealthStatus& status);
void to_json(nlohmann::json& out, const RuntimePayload& payload);

}  // namespace edge_twin::core
