#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace edge_twin::optimization {

struct OptimizationPolicy {
  double default_reduction_percent{10.0};
  double max_allowed_load{100.0};
  double min_allowed_load{50.0};
  double cost_weight{0.5};
  double stability_weight{0.3};
  double energy_cost_per_unit{0.12};
};

struct OptimizationResult {
  double recommended_reduction{0.0};
  double predicted_load{0.0};
  double cost_saving_estimate{0.0};
  std::optional<double> stability_score{};
  std::uint64_t timestamp_ms{0};
  std::string status{"ok"};
};

// Turns a predicted load into a bounded reduction recommendation.
class LoadOptimizer {
 public:
  explicit LoadOptimizer(OptimizationPolicy policy = {});

  // Never throws; a failed computation returns reduction 0 with status "failed".
  OptimizationResult optimize_load(double current_load, double predicted_load);

  double required_reduction(double predicted_load) const noexcept;
  double apply_constraints(double current_load, double reduction) const noexcept;
  double cost_saving(double reduction, double current_load) const noexcept;
  static double stability_score(double reduction) noexcept;
  double multi_objective_score(double cost_saving, double stability_score) const noexcept;

  std::optional<OptimizationResult> last_result() const;
  std::optional<std::uint64_t> last_optimization_time() const;

  const OptimizationPolicy& policy() const noexcept { return policy_; }

 private:
  OptimizationPolicy policy_;

  mutable std::mutex mutex_;
  std::optional<OptimizationResult> last_result_{};
  std::optional<std::uint64_t> last_optimization_ms_{};
};

}  // namespace edge_twin::optimization
