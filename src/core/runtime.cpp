#include "core/runtime.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <utility>

#include "core/math.hpp"
#include "core/timestamp.hpp"
#include "decision/decision_input.hpp"
#include "health/health_scorer.hpp"
#include "telemetry/blend.hpp"
#include "telemetry/industrial.hpp"

namespace edge_twin::core {
namespace {

telemetry::LiveTelemetry make_live_telemetry(const RuntimeConfig& config,
                                             std::unique_ptr<telemetry::TelemetrySource> override_source) {
  if (override_source != nullptr) {
    return telemetry::LiveTelemetry(std::move(override_source), nullptr, telemetry::make_loadavg_source());
  }

  std::unique_ptr<telemetry::TelemetrySource> query;
  const auto argv = split_command_line(config.telemetry.query_command);
  if (!argv.empty()) {
    query = telemetry::make_command_source(argv, config.telemetry.query_timeout);
  }
  return telemetry::LiveTelemetry(telemetry::make_host_source(config.telemetry.disk_path), std::move(query),
                                  telemetry::make_loadavg_source());
}

power::PowerProfileController make_power_controller(const RuntimeConfig& config, CommandRunner runner) {
  if (runner) {
    return power::PowerProfileController(config.power, std::move(runner), true);
  }
  return power::PowerProfileController(config.power);
}

}  // namespace

RuntimeService::RuntimeService(RuntimeConfig config, std::unique_ptr<telemetry::TelemetrySource> live_source,
                               std::unique_ptr<decision::DecisionEngine> engine, CommandRunner power_runner)
    : config_(std::move(config)),
      live_(make_live_telemetry(config_, std::move(live_source))),
      simulator_(config_.simulation_seed),
      engine_(std::move(engine)),
      power_(make_power_controller(config_, std::move(power_runner))),
      mode_(config_.mode) {
  if (engine_ == nullptr) {
    engine_ = std::make_unique<decision::OptimizingDecisionEngine>(config_.optimization);
  }

  if (!power_.platform_supported()) {
    std::cerr << "[power] " << power::to_string(config_.power.backend)
              << " not found on PATH; power profiles will not be applied\n";
  }

  if (config_.redis.enabled) {
    sinks::RedisTsOptions options{};
    options.host = config_.redis.host;
    options.port = config_.redis.port;
    options.unix_socket = config_.redis.unix_socket;
    options.key_prefix = config_.redis.key_prefix;
    redis_sink_ = std::make_unique<sinks::RedisTsSink>(options);

    const std::string target =
        options.unix_socket.empty() ? options.host + ':' + std::to_string(options.port) : "unix://" + options.unix_socket;
    if (redis_sink_->check_connectivity()) {
      std::cerr << "[runtime] redis connectivity confirmed at " << target << '\n';
    } else {
      std::cerr << "[runtime] redis connectivity check failed at " << target << '\n';
    }
  }
}

RuntimeService::~RuntimeService() { stop(); }

void RuntimeService::start() {
  if (running_.exchange(true)) {
    return;
  }
  worker_ = std::thread(&RuntimeService::run_loop, this);
  std::cerr << "[runtime] started, scanning every " << config_.scan_interval.count() << " ms in "
            << model::to_string(config_.mode) << " mode\n";
}

void RuntimeService::stop() {
  {
    std::lock_guard<std::mutex> lock(wake_mutex_);
    if (!running_.exchange(false) && !worker_.joinable()) {
      return;
    }
  }
  wake_cv_.notify_all();
  if (worker_.joinable()) {
    worker_.join();
  }
  std::cerr << "[runtime] stopped\n";
}

void RuntimeService::run_loop() {
  auto next_wakeup = std::chrono::steady_clock::now();

  while (running_.load()) {
    const auto cycle_start = std::chrono::steady_clock::now();
    scan_now();
    const auto cycle_end = std::chrono::steady_clock::now();

    if (cycle_end - cycle_start > config_.scan_interval) {
      std::lock_guard<std::mutex> lock(state_mutex_);
      ++missed_cycles_;
    }

    next_wakeup += config_.scan_interval;
    if (next_wakeup < cycle_end) {
      next_wakeup = cycle_end;
    }

    std::unique_lock<std::mutex> lock(wake_mutex_);
    wake_cv_.wait_until(lock, next_wakeup, [this]() { return !running_.load(); });
  }
}

void RuntimeService::scan_now() {
  std::lock_guard<std::mutex> scan_lock(scan_mutex_);
  try {
    run_cycle();
  } catch (const std::exception& ex) {
    std::cerr << "[runtime] scan failed: " << ex.what() << '\n';
    std::lock_guard<std::mutex> lock(state_mutex_);
    last_scan_error_ = ex.what();
    ++scan_errors_;
  }
}

model::TelemetrySnapshot RuntimeService::collect_live(std::optional<std::string>& error) {
  try {
    model::TelemetrySnapshot snapshot = live_.collect();
    if (!telemetry_was_ok_) {
      std::cerr << "[telemetry] live collection recovered\n";
      telemetry_was_ok_ = true;
    }
    return snapshot;
  } catch (const telemetry::TelemetryError& ex) {
    error = ex.what();
    if (telemetry_was_ok_) {
      std::cerr << "[telemetry] " << ex.what() << "; using load average estimate\n";
      telemetry_was_ok_ = false;
    }
    return live_.collect_estimate();
  }
}

decision::DecisionPayload RuntimeService::decide(const model::TelemetrySnapshot& snapshot) {
  const auto input = decision::to_decision_input(snapshot);
  try {
    return engine_->generate_decision(input);
  } catch (const std::exception& ex) {
    std::cerr << "[runtime] decision engine failed: " << ex.what() << '\n';
    decision::DecisionPayload empty{};
    empty.state = input.state;
    return empty;
  }
}

void RuntimeService::run_cycle() {
  model::RuntimeMode mode{};
  scenario::ScenarioInjector scenario_state{};
  std::uint64_t generation = 0;
  std::optional<model::TelemetrySnapshot> previous{};
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    mode = mode_;
    scenario_state = scenario_;
    generation = scenario_generation_;
    if (latest_.has_value()) {
      previous = latest_->snapshot;
    }
  }

  // The twin advances every scan so its trajectory does not depend on the mode.
  std::optional<std::string> error{};
  const model::TelemetrySnapshot simulated = simulator_.collect();
  model::TelemetrySnapshot snapshot{};
  switch (mode) {
    case model::RuntimeMode::SIMULATION:
      snapshot = simulated;
      break;
    case model::RuntimeMode::HYBRID:
      snapshot = telemetry::blend(collect_live(error), simulated);
      break;
    case model::RuntimeMode::LIVE_EDGE:
      snapshot = collect_live(error);
      break;
  }

  snapshot.scan_mode = mode;
  const bool scenario_completed = scenario_state.apply(snapshot);
  snapshot.industrial = telemetry::derive_industrial_metrics(snapshot);

  CycleRecord record{};
  record.decision = decide(snapshot);
  record.optimization_score = health::optimization_score(snapshot);
  record.health = health::build_runtime_health(snapshot, record.decision);

  const model::PowerProfile profile = power::PowerProfileController::pick_profile(snapshot);
  if (mode == model::RuntimeMode::SIMULATION) {
    record.power = model::PowerAction{false, profile, "simulation_mode"};
  } else {
    record.power = power_.apply(profile);
  }

  const std::string time_label = format_clock_label(snapshot.timestamp_ms);
  auto notices = alert_engine_.evaluate(snapshot, previous.has_value() ? &*previous : nullptr,
                                        record.optimization_score, record.power, time_label);
  record.snapshot = std::move(snapshot);

  std::uint64_t scan_errors = 0;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    // A set_scenario() during this scan wins over the injector copy.
    if (scenario_generation_ == generation) {
      scenario_ = scenario_state;
      if (scenario_completed) {
        push_event_locked(model::EventType::INFO, "scenario_completed normal", time_label);
      }
    }

    for (auto& event : notices.events) {
      push_event_locked(event.type, std::move(event.message), time_label);
    }
    for (auto& alert : notices.alerts) {
      push_alert_locked(std::move(alert));
    }

    history_.push(model::HistoryRecord{record.snapshot.timestamp_ms, time_label, record.optimization_score,
                                       round2(record.snapshot.cpu_percent)});
    latest_ = record;
    last_scan_error_ = error;
    if (error.has_value()) {
      ++scan_errors_;
    }
    ++scans_completed_;
    scan_errors = scan_errors_;
  }

  publish_sinks(record, scan_errors);
}

void RuntimeService::publish_sinks(const CycleRecord& record, const std::uint64_t scan_errors) {
  if (config_.stdout_debug) {
    stdout_sink_.publish(record);
  }

  if (redis_sink_ != nullptr) {
    const bool ok = redis_sink_->publish(record, scan_errors);
    if (!ok) {
      if (redis_was_ok_) {
        std::cerr << "[redis] publish failed\n";
        redis_was_ok_ = false;
      }
    } else if (!redis_was_ok_) {
      std::cerr << "[redis] publish recovered\n";
      redis_was_ok_ = true;
    }
  }
}

void RuntimeService::push_event_locked(const model::EventType type, std::string message,
                                       const std::string& time_label) {
  events_.push(model::Event{next_event_id_++, type, std::move(message), time_label});
}

void RuntimeService::push_alert_locked(model::Alert alert) {
  alert.id = next_alert_id_++;
  alerts_.push(std::move(alert));
}

HealthStatus RuntimeService::health_status_locked() const {
  HealthStatus status{};
  status.running = running_.load();
  status.scan_interval = config_.scan_interval;
  status.last_scan_error = last_scan_error_;
  status.auto_apply = power_.auto_apply();
  status.mode = mode_;
  status.scenario = scenario_.scenario();
  status.scenario_cycles_left = scenario_.cycles_left();
  if (latest_.has_value()) {
    status.latest_timestamp_ms = latest_->snapshot.timestamp_ms;
  }
  status.scans_completed = scans_completed_;
  status.missed_cycles = missed_cycles_;
  return status;
}

HealthStatus RuntimeService::health_status() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return health_status_locked();
}

RuntimePayload RuntimeService::latest_payload(const std::size_t history_limit, const std::size_t event_limit,
                                              const std::size_t alert_limit) const {
  RuntimePayload payload{};
  payload.generated_at_ms = unix_timestamp_now_ms();
  payload.supported_modes = {"HYBRID", "LIVE_EDGE", "SIMULATION"};
  payload.supported_scenarios = {"grid_failure", "low_load", "normal", "peak_load"};

  std::lock_guard<std::mutex> lock(state_mutex_);
  payload.mode = mode_;
  payload.scenario = scenario_.scenario();
  if (latest_.has_value()) {
    payload.telemetry = latest_->snapshot;
    payload.decision = latest_->decision;
    payload.optimization = latest_->decision.optimized_decision;
    payload.power_action = latest_->power;
    payload.runtime_health = latest_->health;
  }
  payload.history = history_.tail(history_limit);
  payload.events = events_.tail(event_limit);
  payload.alerts = alerts_.tail(alert_limit);
  payload.service_health = health_status_locked();
  return payload;
}

void RuntimeService::set_mode(const std::string_view mode) {
  const auto parsed = model::parse_runtime_mode(mode);
  if (!parsed.has_value()) {
    throw std::invalid_argument("unsupported runtime mode: " + std::string(mode));
  }
  set_mode(*parsed);
}

void RuntimeService::set_mode(const model::RuntimeMode mode) {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    mode_ = mode;
    push_event_locked(model::EventType::INFO, std::string("runtime_mode_changed ") + model::to_string(mode),
                      format_clock_label(unix_timestamp_now_ms()));
  }
  scan_now();
}

void RuntimeService::set_scenario(const std::string_view scenario, const int cycles) {
  const auto parsed = model::parse_scenario(scenario);
  if (!parsed.has_value()) {
    throw std::invalid_argument("unsupported scenario: " + std::string(scenario));
  }

  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    scenario_.set(*parsed, cycles);
    ++scenario_generation_;
    push_event_locked(*parsed == model::Scenario::NORMAL ? model::EventType::INFO : model::EventType::WARN,
                      std::string("scenario_set ") + model::to_string(*parsed),
                      format_clock_label(unix_timestamp_now_ms()));
  }
  scan_now();
}

void RuntimeService::set_auto_apply(const bool enabled) {
  power_.set_auto_apply(enabled);
  std::lock_guard<std::mutex> lock(state_mutex_);
  push_event_locked(model::EventType::INFO, std::string("auto_apply_power_profile ") + (enabled ? "enabled" : "disabled"),
                    format_clock_label(unix_timestamp_now_ms()));
}

}  // namespace edge_twin::core
