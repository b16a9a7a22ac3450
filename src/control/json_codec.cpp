#include "control/json_codec.hpp"

#include <optional>

#include "core/timestamp.hpp"

namespace {

template <typename T>
nlohmann::json optional_json(const std::optional<T>& value) {
  if (!value.has_value()) {
    return nullptr;
  }
  return nlohmann::json(*value);
}

}  // namespace

namespace edge_twin::model {

void to_json(nlohmann::json& out, const IndustrialMetrics& metrics) {
  out = nlohmann::json{{"site_id", metrics.site_id},
                       {"energy_usage_kwh", metrics.energy_usage_kwh},
                       {"thermal_index_c", metrics.thermal_index_c},
                       {"grid_load", metrics.grid_load}};
}

void to_json(nlohmann::json& out, const TelemetrySnapshot& snapshot) {
  out = nlohmann::json{{"timestamp", core::format_iso8601_utc(snapshot.timestamp_ms)},
                       {"hostname", snapshot.hostname},
                       {"platform", snapshot.platform},
                       {"cpu_percent", snapshot.cpu_percent},
                       {"memory_percent", snapshot.memory_percent},
                       {"disk_percent", snapshot.disk_percent},
                       {"battery_percent", optional_json(snapshot.battery_percent)},
                       {"power_plugged", optional_json(snapshot.power_plugged)},
                       {"process_count", snapshot.process_count},
                       {"fault_flag", snapshot.fault_flag},
                       {"grid_status", snapshot.grid_status},
                       {"scan_mode", to_string(snapshot.scan_mode)},
                       {"scenario", to_string(snapshot.scenario)},
                       {"industrial_metrics", snapshot.industrial}};
}

void to_json(nlohmann::json& out, const Event& event) {
  out = nlohmann::json{{"id", event.id}, {"type", to_string(event.type)}, {"message", event.message}, {"time", event.time}};
}

void to_json(nlohmann::json& out, const Alert& alert) {
  out = nlohmann::json{{"id", alert.id},
                       {"severity", to_string(alert.severity)},
                       {"title", alert.title},
                       {"message", alert.message},
                       {"time", alert.time}};
}

void to_json(nlohmann::json& out, const HistoryRecord& record) {
  out = nlohmann::json{{"timestamp", core::format_iso8601_utc(record.timestamp_ms)},
                       {"time", record.time},
                       {"optimization", record.optimization},
                       {"energy", record.energy}};
}

void to_json(nlohmann::json& out, const RuntimeHealthMetric& metric) {
  out = nlohmann::json{{"name", metric.name}, {"value", metric.value}};
}

void to_json(nlohmann::json& out, const PowerAction& action) {
  out = nlohmann::json{{"applied", action.applied},
                       {"requested_profile", to_string(action.requested)},
                       {"applied_profile", action.applied ? nlohmann::json(to_string(action.requested)) : nullptr},
                       {"reason", action.reason.empty() ? nlohmann::json(nullptr) : nlohmann::json(action.reason)}};
}

}  // namespace edge_twin::model

namespace edge_twin::optimization {

void to_json(nlohmann::json& out, const OptimizationResult& result) {
  out = nlohmann::json{{"recommended_reduction", result.recommended_reduction},
                       {"predicted_load", result.predicted_load},
                       {"cost_saving_estimate", result.cost_saving_estimate},
                       {"stability_score", optional_json(result.stability_score)},
                       {"optimization_timestamp", core::format_iso8601_utc(result.timestamp_ms)},
                       {"status", result.status}};
}

}  // namespace edge_twin::optimization

namespace edge_twin::decision {

void to_json(nlohmann::json& out, const DecisionPayload& decision) {
  out = nlohmann::json{{"state", decision.state},
                       {"recommended_action", decision.recommended_action},
                       {"optimized_decision", optional_json(decision.optimized_decision)},
                       {"stability_score", stability_score(decision)}};
}

}  // namespace edge_twin::decision

namespace edge_twin::core {

void to_json(nlohmann::json& out, const HealthStatus& status) {
  out = nlohmann::json{
      {"running", status.running},
      {"scan_interval_seconds", static_cast<double>(status.scan_interval.count()) / 1000.0},
      {"last_scan_error", optional_json(status.last_scan_error)},
      {"auto_apply_power_profile", status.auto_apply},
      {"runtime_mode", model::to_string(status.mode)},
      {"scenario", model::to_string(status.scenario)},
      {"scenario_cycles_left", status.scenario_cycles_left},
      {"latest_timestamp", status.latest_timestamp_ms.has_value()
                               ? nlohmann::json(format_iso8601_utc(*status.latest_timestamp_ms))
                               : nlohmann::json(nullptr)},
      {"scans_completed", status.scans_completed},
      {"missed_cycles", status.missed_cycles}};
}

void to_json(nlohmann::json& out, const RuntimePayload& payload) {
  nlohmann::json service_health = payload.service_health;
  service_health["supported_modes"] = payload.supported_modes;
  service_health["supported_scenarios"] = payload.supported_scenarios;

  out = nlohmann::json{{"status", payload.status},
                       {"mode", model::to_string(payload.mode)},
                       {"scenario", model::to_string(payload.scenario)},
                       {"timestamp", format_iso8601_utc(payload.generated_at_ms)},
                       {"telemetry", payload.telemetry.has_value() ? nlohmann::json(*payload.telemetry)
                                                                   : nlohmann::json::object()},
                       {"decision", payload.decision.has_value() ? nlohmann::json(*payload.decision)
                                                                 : nlohmann::json::object()},
                       {"optimization", optional_json(payload.optimization)},
                       {"power_action", optional_json(payload.power_action)},
                       {"runtime_health", payload.runtime_health},
                       {"history", payload.history},
                       {"events", payload.events},
                       {"alerts", payload.alerts},
                       {"service_health", service_health}};
}

}  // namespace edge_twin::core
