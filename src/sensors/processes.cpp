#include "sensors/processes.hpp"

#include <dirent.h>

#include <cctype>
#include <cstdint>
#include <utility>

namespace edge_twin::sensors {

ProcessSensor::ProcessSensor(std::string proc_root) : proc_root_(std::move(proc_root)) {}

bool ProcessSensor::sample(model::TelemetrySnapshot& snapshot) noexcept {
  snapshot.process_count = 0;

  DIR* dir = opendir(proc_root_.c_str());
  if (dir == nullptr) {
    return false;
  }

  std::uint32_t count = 0;
  while (const dirent* entry = readdir(dir)) {
    const char* name = entry->d_name;
    if (*name == '\0') {
      continue;
    }

    bool numeric = true;
    for (const char* c = name; *c != '\0'; ++c) {
      if (std::isdigit(static_cast<unsigned char>(*c)) == 0) {
        numeric = false;
        break;
      }
    }
    if (numeric) {
      ++count;
    }
  }
  closedir(dir);

  snapshot.process_count = count;
  return true;
}

}  // namespace edge_twin::sensors
