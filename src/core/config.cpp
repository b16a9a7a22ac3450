#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace edge_twin::core {
namespace {

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::string unquote(const std::string& value) {
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool parse_bool(const std::string& key, const std::string& value) {
  std::string lower;
  lower.reserve(value.size());
  for (const char c : value) {
    lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }

  if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") {
    return true;
  }
  if (lower == "false" || lower == "no" || lower == "off" || lower == "0") {
    return false;
  }
  throw std::runtime_error(key + " must be a boolean");
}

double parse_non_negative(const std::string& key, const std::string& value) {
  const double parsed = std::stod(value);
  if (parsed < 0.0) {
    throw std::runtime_error(key + " must be greater than or equal to 0");
  }
  return parsed;
}

std::chrono::milliseconds parse_timeout_ms(const std::string& key, const std::string& value) {
  const auto parsed = std::stoll(value);
  if (parsed <= 0) {
    throw std::runtime_error(key + " must be greater than 0");
  }
  return std::chrono::milliseconds(parsed);
}

void apply_redis_address(RedisConfig& redis, const std::string& value) {
  redis.enabled = !value.empty();
  if (value.rfind("unix://", 0) == 0) {
    redis.unix_socket = value.substr(std::string("unix://").size());
    redis.host.clear();
    redis.port = 0;
    return;
  }

  if (!value.empty() && value.front() == '/') {
    redis.unix_socket = value;
    redis.host.clear();
    redis.port = 0;
    return;
  }

  redis.unix_socket.clear();
  const auto split = value.find(':');
  if (split == std::string::npos) {
    redis.host = value;
    return;
  }

  redis.host = value.substr(0, split);
  const auto parsed_port = std::stoi(value.substr(split + 1));
  if (parsed_port <= 0 || parsed_port > 65535) {
    throw std::runtime_error("redis.address port must be in range 1..65535");
  }
  redis.port = static_cast<std::uint16_t>(parsed_port);
}

void apply_key_value(RuntimeConfig& config, const std::string& key, const std::string& value) {
  if (key == "scan_interval_s") {
    const double seconds = std::stod(value);
    if (seconds <= 0.0) {
      throw std::runtime_error("scan_interval_s must be greater than 0");
    }
    if (seconds > 3600.0) {
      throw std::runtime_error("scan_interval_s must be less than or equal to 3600");
    }
    const std::chrono::milliseconds interval(static_cast<std::int64_t>(seconds * 1000.0));
    if (interval.count() < 1) {
      throw std::runtime_error("scan_interval_s must be at least 0.001");
    }
    config.scan_interval = interval;
    return;
  }

  if (key == "runtime.mode") {
    const auto mode = model::parse_runtime_mode(value);
    if (!mode.has_value()) {
      throw std::runtime_error("runtime.mode must be LIVE_EDGE, SIMULATION or HYBRID");
    }
    config.mode = *mode;
    return;
  }

  if (key == "runtime.auto_apply_power_profile") {
    config.power.auto_apply = parse_bool(key, value);
    return;
  }

  if (key == "simulation.seed") {
    if (!value.empty() && value.front() == '-') {
      throw std::runtime_error("simulation.seed must be greater than or equal to 0");
    }
    config.simulation_seed = std::stoull(value, nullptr, 0);
    return;
  }

  if (key == "telemetry.disk_path") {
    if (value.empty()) {
      throw std::runtime_error("telemetry.disk_path must not be empty");
    }
    config.telemetry.disk_path = value;
    return;
  }

  if (key == "telemetry.query_command") {
    config.telemetry.query_command = value;
    return;
  }

  if (key == "telemetry.query_timeout_ms") {
    config.telemetry.query_timeout = parse_timeout_ms(key, value);
    return;
  }

  if (key == "optimization.default_reduction_percent") {
    config.optimization.default_reduction_percent = parse_non_negative(key, value);
    if (config.optimization.default_reduction_percent > 100.0) {
      throw std::runtime_error(key + " must be less than or equal to 100");
    }
    return;
  }

  if (key == "optimization.max_allowed_load") {
    config.optimization.max_allowed_load = parse_non_negative(key, value);
    return;
  }

  if (key == "optimization.min_allowed_load") {
    config.optimization.min_allowed_load = parse_non_negative(key, value);
    return;
  }

  if (key == "optimization.cost_weight") {
    config.optimization.cost_weight = parse_non_negative(key, value);
    return;
  }

  if (key == "optimization.stability_weight") {
    config.optimization.stability_weight = parse_non_negative(key, value);
    return;
  }

  if (key == "optimization.energy_cost_per_unit") {
    config.optimization.energy_cost_per_unit = parse_non_negative(key, value);
    return;
  }

  if (key == "power.backend") {
    const auto backend = power::parse_power_backend(value);
    if (!backend.has_value()) {
      throw std::runtime_error("power.backend must be powerprofilesctl or powercfg");
    }
    config.power.backend = *backend;
    return;
  }

  if (key == "power.cooldown_s") {
    const auto seconds = std::stoll(value);
    if (seconds < 0) {
      throw std::runtime_error("power.cooldown_s must be greater than or equal to 0");
    }
    config.power.cooldown = std::chrono::seconds(seconds);
    return;
  }

  if (key == "power.timeout_ms") {
    config.power.timeout = parse_timeout_ms(key, value);
    return;
  }

  if (key == "agent.stdout_debug") {
    config.stdout_debug = parse_bool(key, value);
    return;
  }

  if (key == "redis.address") {
    apply_redis_address(config.redis, value);
    return;
  }

  if (key == "redis.key_prefix") {
    if (value.empty()) {
      throw std::runtime_error("redis.key_prefix must not be empty");
    }
    config.redis.key_prefix = value;
    return;
  }

  if (key == "control.stdio") {
    config.control_stdio = parse_bool(key, value);
  }
}

}  // namespace

RuntimeConfig load_runtime_config(const std::string& path) {
  RuntimeConfig config{};

  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open config file: " + path);
  }

  std::vector<std::string> sections;
  std::string line;
  while (std::getline(input, line)) {
    const auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line.erase(comment_pos);
    }

    if (trim(line).empty()) {
      continue;
    }

    std::size_t indent_spaces = 0;
    while (indent_spaces < line.size() && line[indent_spaces] == ' ') {
      ++indent_spaces;
    }
    const std::size_t depth = indent_spaces / 2;

    const std::string stripped = trim(line);
    const auto colon_pos = stripped.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    const std::string key = trim(stripped.substr(0, colon_pos));
    const std::string value = unquote(trim(stripped.substr(colon_pos + 1)));

    if (sections.size() > depth) {
      sections.resize(depth);
    }

    if (value.empty() && trim(stripped.substr(colon_pos + 1)).empty()) {
      sections.resize(depth + 1);
      sections[depth] = key;
      continue;
    }

    std::ostringstream full_key;
    for (const auto& section : sections) {
      if (!section.empty()) {
        full_key << section << '.';
      }
    }
    full_key << key;

    try {
      apply_key_value(config, full_key.str(), value);
    } catch (const std::logic_error&) {
      // std::stoi and friends report bad numbers as invalid_argument/out_of_range.
      throw std::runtime_error("invalid value for " + full_key.str() + ": " + value);
    }
  }

  if (config.optimization.min_allowed_load > config.optimization.max_allowed_load) {
    throw std::runtime_error("optimization.min_allowed_load must not exceed optimization.max_allowed_load");
  }

  return config;
}

}  // namespace edge_twin::core
