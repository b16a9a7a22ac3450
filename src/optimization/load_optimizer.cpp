#include "optimization/load_optimizer.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>

#include "core/timestamp.hpp"

namespace edge_twin::optimization {

LoadOptimizer::LoadOptimizer(const OptimizationPolicy policy) : policy_(policy) {}

double LoadOptimizer::required_reduction(const double predicted_load) const noexcept {
  if (predicted_load > policy_.max_allowed_load) {
    const double overload = predicted_load - policy_.max_allowed_load;
    return std::max(overload / predicted_load * 100.0, policy_.default_reduction_percent);
  }
  return policy_.default_reduction_percent * 0.3;
}

double LoadOptimizer::apply_constraints(const double current_load, const double reduction) const noexcept {
  if (current_load == 0.0) {
    return 0.0;
  }

  const double reduced_load = current_load * (1.0 - reduction / 100.0);
  if (reduced_load < policy_.min_allowed_load) {
    return std::max((current_load - policy_.min_allowed_load) / current_load * 100.0, 0.0);
  }
  return std::min(reduction, 50.0);
}

double LoadOptimizer::cost_saving(const double reduction, const double current_load) const noexcept {
  return current_load * (reduction / 100.0) * policy_.energy_cost_per_unit;
}

double LoadOptimizer::stability_score(const double reduction) noexcept {
  if (reduction < 10.0) {
    return 0.95;
  }
  if (reduction < 25.0) {
    return 0.85;
  }
  return 0.70;
}

double LoadOptimizer::multi_objective_score(const double cost_saving, const double stability_score) const noexcept {
  return cost_saving * policy_.cost_weight + stability_score * policy_.stability_weight;
}

OptimizationResult LoadOptimizer::optimize_load(const double current_load, const double predicted_load) {
  try {
    if (!std::isfinite(current_load) || !std::isfinite(predicted_load)) {
      throw std::domain_error("non-finite load");
    }

    const double reduction = apply_constraints(current_load, required_reduction(predicted_load));

    OptimizationResult result{};
    result.recommended_reduction = reduction;
    result.predicted_load = predicted_load;
    result.cost_saving_estimate = cost_saving(reduction, current_load);
    result.stability_score = stability_score(reduction);
    result.timestamp_ms = core::unix_timestamp_now_ms();
    result.status = "ok";

    std::lock_guard<std::mutex> lock(mutex_);
    last_result_ = result;
    last_optimization_ms_ = result.timestamp_ms;
    return result;
  } catch (const std::exception& ex) {
    std::cerr << "[optimizer] optimization failed: " << ex.what() << '\n';
    OptimizationResult failed{};
    failed.recommended_reduction = 0.0;
    failed.timestamp_ms = core::unix_timestamp_now_ms();
    failed.status = "failed";
    return failed;
  }
}

std::optional<OptimizationResult> LoadOptimizer::last_result() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_result_;
}

std::optional<std::uint64_t> LoadOptimizer::last_optimization_time() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_optimization_ms_;
}

}  // namespace edge_twin::optimization
