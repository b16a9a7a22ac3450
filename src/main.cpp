#include <chrono>
#include <csignal>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

#include "control/methods.hpp"
#include "control/server.hpp"
#include "core/config.hpp"
#include "core/runtime.hpp"

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void handle_shutdown_signal(int /*signal*/) {
  g_shutdown_requested = 1;
}

// No SA_RESTART, so a blocking read on stdin returns when a signal lands.
void install_shutdown_handler(const int signal_number) {
  struct sigaction action {};
  action.sa_handler = handle_shutdown_signal;
  sigemptyset(&action.sa_mask);
  action.sa_flags = 0;
  sigaction(signal_number, &action, nullptr);
}

}  // namespace

std::string format_config_settings(const edge_twin::core::RuntimeConfig& config, const std::string& config_path) {
  std::ostringstream output;
  output << "[runtime] loaded config from " << config_path
         << " | scan_interval_ms=" << config.scan_interval.count()
         << " | mode=" << edge_twin::model::to_string(config.mode)
         << " | auto_apply_power_profile=" << (config.power.auto_apply ? "true" : "false")
         << " | power_backend=" << edge_twin::power::to_string(config.power.backend)
         << " | disk_path=" << config.telemetry.disk_path
         << " | query_command=" << (config.telemetry.query_command.empty() ? "<none>" : config.telemetry.query_command)
         << " | stdout_debug=" << (config.stdout_debug ? "true" : "false")
         << " | control_stdio=" << (config.control_stdio ? "true" : "false")
         << " | redis_enabled=" << (config.redis.enabled ? "true" : "false")
         << " | redis_address=";

  if (!config.redis.unix_socket.empty()) {
    output << "unix://" << config.redis.unix_socket;
  } else {
    output << config.redis.host << ':' << config.redis.port;
  }
  return output.str();
}

int main(int argc, char** argv) {
  install_shutdown_handler(SIGINT);
  install_shutdown_handler(SIGTERM);

  const std::string config_path = argc > 1 ? argv[1] : "configs/edge-twin.yaml";

  edge_twin::core::RuntimeConfig config{};
  try {
    config = edge_twin::core::load_runtime_config(config_path);
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  }

  if (config.control_stdio && config.stdout_debug) {
    std::cerr << "[runtime] stdout carries JSON-RPC responses; disabling stdout_debug\n";
    config.stdout_debug = false;
  }

  std::cerr << format_config_settings(config, config_path) << '\n';

  edge_twin::core::RuntimeService service{config};
  service.start();

  if (config.control_stdio) {
    const edge_twin::control::Server server{edge_twin::control::build_method_registry(service)};
    server.run(std::cin, std::cout, std::cerr);
    std::cerr << "[control] stdin closed; stopping\n";
  } else {
    while (g_shutdown_requested == 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    std::cerr << "[runtime] shutdown signal received; exiting cleanly\n";
  }

  service.stop();
  return 0;
}
