#include "control/methods.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

#include "control/json_codec.hpp"

namespace edge_twin::control {
namespace {

std::size_t limit_param(const nlohmann::json& params, const char* key, const std::size_t fallback) {
  const auto it = params.find(key);
  if (it == params.end() || it->is_null()) {
    return fallback;
  }
  if (!it->is_number_integer() || it->get<std::int64_t>() < 0) {
    throw std::invalid_argument(std::string(key) + " must be a non-negative integer");
  }
  return static_cast<std::size_t>(it->get<std::int64_t>());
}

std::string string_param(const nlohmann::json& params, const char* key) {
  const auto it = params.find(key);
  if (it == params.end() || !it->is_string()) {
    throw std::invalid_argument(std::string(key) + " must be a string");
  }
  return it->get<std::string>();
}

void add(MethodRegistry& registry, std::string name, std::string description,
         std::function<nlohmann::json(const nlohmann::json&)> handler) {
  Method method{.name = name, .description = std::move(description), .handler = std::move(handler)};
  registry.emplace(std::move(name), std::move(method));
}

}  // namespace

MethodRegistry build_method_registry(core::RuntimeService& service) {
  MethodRegistry registry;

  add(registry, "runtime.status", "Service flags, mode, scenario and last scan error",
      [&service](const nlohmann::json&) { return nlohmann::json(service.health_status()); });

  add(registry, "runtime.payload", "Latest snapshot, decision and health with bounded history, events and alerts",
      [&service](const nlohmann::json& params) {
        const auto history_limit = limit_param(params, "history_limit", 30);
        const auto event_limit = limit_param(params, "event_limit", 30);
        const auto alert_limit = limit_param(params, "alert_limit", 10);
        return nlohmann::json(service.latest_payload(history_limit, event_limit, alert_limit));
      });

  add(registry, "runtime.scan", "Run one scan now", [&service](const nlohmann::json&) {
    service.scan_now();
    return nlohmann::json(service.health_status());
  });

  add(registry, "runtime.set_mode", "Switch between LIVE_EDGE, SIMULATION and HYBRID",
      [&service](const nlohmann::json& params) {
        service.set_mode(string_param(params, "mode"));
        return nlohmann::json(service.health_status());
      });

  add(registry, "runtime.set_scenario", "Inject a scenario for a number of scans",
      [&service](const nlohmann::json& params) {
        int cycles = 12;
        const auto it = params.find("cycles");
        if (it != params.end() && !it->is_null()) {
          if (!it->is_number_integer()) {
            throw std::invalid_argument("cycles must be an integer");
          }
          cycles = static_cast<int>(std::clamp<std::int64_t>(it->get<std::int64_t>(), -1, 1000));
        }
        service.set_scenario(string_param(params, "scenario"), cycles);
        return nlohmann::json(service.health_status());
      });

  add(registry, "runtime.set_auto_apply", "Enable or disable automatic power profile switching",
      [&service](const nlohmann::json& params) {
        const auto it = params.find("enabled");
        if (it == params.end() || !it->is_boolean()) {
          throw std::invalid_argument("enabled must be a boolean");
        }
        service.set_auto_apply(it->get<bool>());
        return nlohmann::json(service.health_status());
      });

  return registry;
}

}  // namespace edge_twin::control
