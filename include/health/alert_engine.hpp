#pragma once

#include <string>
#include <vector>

#include "model/runtime_records.hpp"
#include "model/telemetry_snapshot.hpp"

namespace edge_twin::health {

struct AlertRules {
  double cpu_critical_pct = 90.0;      // edge-triggered
  double memory_high_pct = 90.0;       // edge-triggered
  double battery_low_pct = 20.0;       // every scan while low
};

// One scan's notices, ids left at zero for the owner to assign.
struct CycleNotices {
  std::vector<model::Event> events;
  std::vector<model::Alert> alerts;
};

class AlertEngine {
 public:
  explicit AlertEngine(AlertRules rules = {});

  // `previous` is the last committed snapshot, or nullptr before the first one.
  CycleNotices evaluate(const model::TelemetrySnapshot& current, const model::TelemetrySnapshot* previous,
                        double score, const model::PowerAction& power, const std::string& time_label) const;

  const AlertRules& rules() const noexcept { return rules_; }

 private:
  AlertRules rules_;
};

}  // namespace edge_twin::health
