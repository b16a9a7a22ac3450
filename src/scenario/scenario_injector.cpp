#include "scenario/scenario_injector.hpp"

#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace edge_twin::scenario {

void ScenarioInjector::set(const std::string_view name, const int cycles) {
  const auto parsed = model::parse_scenario(name);
  if (!parsed.has_value()) {
    throw std::invalid_argument("unsupported scenario: " + std::string(name));
  }
  set(*parsed, cycles);
}

void ScenarioInjector::set(const model::Scenario scenario, const int cycles) noexcept {
  scenario_ = scenario;
  if (scenario == model::Scenario::NORMAL) {
    cycles_left_ = 0;
    return;
  }
  cycles_left_ = std::max(1, std::clamp(cycles, 0, kMaxCycles));
}

bool ScenarioInjector::apply(model::TelemetrySnapshot& snapshot) noexcept {
  switch (scenario_) {
    case model::Scenario::PEAK_LOAD:
      snapshot.cpu_percent = std::max(92.0, snapshot.cpu_percent);
      snapshot.memory_percent = std::max(88.0, snapshot.memory_percent);
      snapshot.disk_percent = std::max(78.0, snapshot.disk_percent);
      snapshot.process_count = std::max<std::uint32_t>(450, snapshot.process_count);
      snapshot.fault_flag = false;
      snapshot.grid_status = "stressed";
      break;
    case model::Scenario::LOW_LOAD:
      snapshot.cpu_percent = std::min(18.0, snapshot.cpu_percent);
      snapshot.memory_percent = std::min(40.0, snapshot.memory_percent);
      snapshot.process_count = std::clamp<std::uint32_t>(snapshot.process_count, 30, 120);
      snapshot.fault_flag = false;
      snapshot.grid_status = "relaxed";
      break;
    case model::Scenario::GRID_FAILURE:
      snapshot.cpu_percent = std::max(72.0, snapshot.cpu_percent);
      snapshot.memory_percent = std::max(70.0, snapshot.memory_percent);
      snapshot.fault_flag = true;
      snapshot.grid_status = "down";
      break;
    case model::Scenario::NORMAL:
      // Masks any live-detected fault as well.
      snapshot.fault_flag = false;
      snapshot.grid_status = "healthy";
      snapshot.scenario = model::Scenario::NORMAL;
      return false;
  }

  --cycles_left_;
  if (cycles_left_ > 0) {
    snapshot.scenario = scenario_;
    return false;
  }
  // The overrides still hold for this scan; the label already reads normal.
  scenario_ = model::Scenario::NORMAL;
  cycles_left_ = 0;
  snapshot.scenario = model::Scenario::NORMAL;
  return true;
}

}  // namespace edge_twin::scenario
