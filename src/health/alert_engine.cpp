#include "health/alert_engine.hpp"

#include <cstdio>
#include <utility>

namespace edge_twin::health {
namespace {

std::string fixed(const double value, const int precision) {
  char buffer[64]{};
  std::snprintf(buffer, sizeof(buffer), "%.*f", precision, value);
  return buffer;
}

}  // namespace

AlertEngine::AlertEngine(AlertRules rules) : rules_(std::move(rules)) {}

CycleNotices AlertEngine::evaluate(const model::TelemetrySnapshot& current, const model::TelemetrySnapshot* previous,
                                   const double score, const model::PowerAction& power,
                                   const std::string& time_label) const {
  CycleNotices notices{};
  const auto event = [&](const model::EventType type, std::string message) {
    notices.events.push_back(model::Event{0, type, std::move(message), time_label});
  };
  const auto alert = [&](const model::AlertSeverity severity, std::string title, std::string message) {
    notices.alerts.push_back(model::Alert{0, severity, std::move(title), std::move(message), time_label});
  };

  event(model::EventType::INFO, std::string("scan_complete mode=") + model::to_string(current.scan_mode) +
                                    " scenario=" + model::to_string(current.scenario) +
                                    " cpu=" + fixed(current.cpu_percent, 1) + "% mem=" +
                                    fixed(current.memory_percent, 1) + "% grid=" +
                                    fixed(current.industrial.grid_load, 2) + " score=" + fixed(score, 1));

  const double previous_cpu = previous != nullptr ? previous->cpu_percent : 0.0;
  const double previous_memory = previous != nullptr ? previous->memory_percent : 0.0;

  if (current.cpu_percent >= rules_.cpu_critical_pct && previous_cpu < rules_.cpu_critical_pct) {
    alert(model::AlertSeverity::CRITICAL, "CPU Pressure Critical",
          "CPU usage reached " + fixed(current.cpu_percent, 1) + "%");
    event(model::EventType::ERROR, "cpu_critical threshold_crossed " + fixed(current.cpu_percent, 1) + "%");
  }

  if (current.memory_percent >= rules_.memory_high_pct && previous_memory < rules_.memory_high_pct) {
    alert(model::AlertSeverity::WARNING, "Memory Pressure High",
          "Memory usage reached " + fixed(current.memory_percent, 1) + "%");
  }

  if (current.battery_percent.has_value() && *current.battery_percent <= rules_.battery_low_pct) {
    alert(model::AlertSeverity::WARNING, "Low Battery Detected",
          "Battery at " + fixed(*current.battery_percent, 1) + "%");
  }

  if (current.fault_flag) {
    alert(model::AlertSeverity::CRITICAL, "Grid Failure Simulation Active",
          "Grid status is DOWN - failover path engaged");
    event(model::EventType::ERROR, "grid_failure detected; failover policy recommended");
  }

  const char* profile = model::to_string(power.requested);
  if (power.applied) {
    event(model::EventType::SUCCESS, std::string("power_profile_applied ") + profile);
  } else {
    event(model::EventType::WARN, std::string("power_profile_not_applied ") + profile + " (" +
                                      (power.reason.empty() ? "n/a" : power.reason) + ")");
  }

  return notices;
}

}  // namespace edge_twin::health
