#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace edge_twin::core {

struct CommandResult {
  int exit_code{-1};
  bool timed_out{false};
  std::string out{};
  std::string err{};

  [[nodiscard]] bool ok() const noexcept { return !timed_out && exit_code == 0; }
};

using CommandRunner =
    std::function<CommandResult(const std::vector<std::string>& argv, std::chrono::milliseconds timeout)>;

// Runs argv[0] (PATH lookup) with stdout and stderr captured. A child still
// running at the deadline is killed and reported as timed out.
CommandResult run_command(const std::vector<std::string>& argv, std::chrono::milliseconds timeout);

[[nodiscard]] bool command_on_path(const std::string& name);

std::vector<std::string> split_command_line(const std::string& command);

}  // namespace edge_twin::core
