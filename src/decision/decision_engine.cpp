#include "decision/decision_engine.hpp"

#include <cmath>
#include <utility>

namespace edge_twin::decision {

double stability_score(const DecisionPayload& decision) noexcept {
  if (!decision.optimized_decision.has_value() || !decision.optimized_decision->stability_score.has_value()) {
    return kDefaultStabilityScore;
  }
  const double score = *decision.optimized_decision->stability_score;
  if (!std::isfinite(score) || score < 0.0 || score > 1.0) {
    return kDefaultStabilityScore;
  }
  return score;
}

OptimizingDecisionEngine::OptimizingDecisionEngine(const optimization::OptimizationPolicy policy)
    : optimizer_(policy) {}

DecisionPayload OptimizingDecisionEngine::generate_decision(const DecisionInput& input) {
  const double predicted_load = input.current_load;
  auto result = optimizer_.optimize_load(input.current_load, predicted_load);

  DecisionPayload payload{};
  payload.state = input.state;
  payload.recommended_action =
      result.status == "ok" && result.recommended_reduction >= optimizer_.policy().default_reduction_percent
          ? "reduce_load"
          : "maintain";
  payload.optimized_decision = std::move(result);
  return payload;
}

}  // namespace edge_twin::decision
