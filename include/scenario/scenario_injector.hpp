#pragma once

#include <string_view>

#include "model/telemetry_snapshot.hpp"

namespace edge_twin::scenario {

// Overrides snapshot fields for a bounded number of scans, then reverts to
// normal on its own.
class ScenarioInjector {
 public:
  static constexpr int kMaxCycles = 240;

  // Throws std::invalid_argument on an unknown name.
  void set(std::string_view name, int cycles);
  void set(model::Scenario scenario, int cycles) noexcept;

  // Rewrites the snapshot for the active scenario. Returns true on the scan
  // that exhausts the counter and reverts to normal; that scan keeps the
  // overrides but is labelled normal.
  bool apply(model::TelemetrySnapshot& snapshot) noexcept;

  model::Scenario scenario() const noexcept { return scenario_; }
  int cycles_left() const noexcept { return cycles_left_; }

 private:
  model::Scenario scenario_{model::Scenario::NORMAL};
  int cycles_left_{0};
};

}  // namespace edge_twin::scenario
