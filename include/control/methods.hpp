#pragma once

#include <functional>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "core/runtime.hpp"

namespace edge_twin::control {

struct Method {
  std::string name;
  std::string description;
  // Throws std::invalid_argument on bad params.
  std::function<nlohmann::json(const nlohmann::json&)> handler;
};

using MethodRegistry = std::unordered_map<std::string, Method>;

// runtime.* methods forwarding to `service`, which must outlive the registry.
MethodRegistry build_method_registry(core::RuntimeService& service);

}  // namespace edge_twin::control
