#pragma once

#include <algorithm>
#include <cmath>

namespace edge_twin::core {

inline constexpr double clamp_percent(const double value) noexcept {
  return std::clamp(value, 0.0, 100.0);
}

inline double round2(const double value) noexcept {
  return std::round(value * 100.0) / 100.0;
}

}  // namespace edge_twin::core
