#pragma once

#include <optional>
#include <string>

#include "decision/decision_input.hpp"
#include "optimization/load_optimizer.hpp"

namespace edge_twin::decision {

inline constexpr double kDefaultStabilityScore = 0.9;

struct DecisionPayload {
  std::string state{};
  std::string recommended_action{};
  std::optional<optimization::OptimizationResult> optimized_decision{};
};

// Embedded stability score, or kDefaultStabilityScore when it is missing,
// not finite or outside [0, 1].
double stability_score(const DecisionPayload& decision) noexcept;

class DecisionEngine {
 public:
  virtual DecisionPayload generate_decision(const DecisionInput& input) = 0;
  virtual ~DecisionEngine() = default;
};

// Persistence forecast (predicted = current) fed through the load optimizer.
class OptimizingDecisionEngine final : public DecisionEngine {
 public:
  explicit OptimizingDecisionEngine(optimization::OptimizationPolicy policy = {});

  DecisionPayload generate_decision(const DecisionInput& input) override;

  const optimization::LoadOptimizer& optimizer() const noexcept { return optimizer_; }

 private:
  optimization::LoadOptimizer optimizer_;
};

}  // namespace edge_twin::decision
