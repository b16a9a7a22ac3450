#include "sensors/power_supply.hpp"

#include <filesystem>
#include <fstream>

#include "core/math.hpp"

namespace edge_twin::sensors {

namespace {
constexpr const char* kSysClassPowerSupply = "/sys/class/power_supply";
}

PowerSupplySensor::PowerSupplySensor() { discover(kSysClassPowerSupply); }

PowerSupplySensor::PowerSupplySensor(const std::string& power_supply_root) { discover(power_supply_root); }

PowerSupplySensor::PowerSupplySensor(std::FILE* capacity, std::FILE* ac_online, const bool owns_files)
    : capacity_(capacity), ac_online_(ac_online), owns_files_(owns_files) {}

PowerSupplySensor::~PowerSupplySensor() {
  if (!owns_files_) {
    return;
  }
  if (capacity_ != nullptr) {
    std::fclose(capacity_);
    capacity_ = nullptr;
  }
  if (ac_online_ != nullptr) {
    std::fclose(ac_online_);
    ac_online_ = nullptr;
  }
}

void PowerSupplySensor::discover(const std::string& power_supply_root) {
  try {
    if (!std::filesystem::exists(power_supply_root)) {
      return;
    }

    for (const auto& entry : std::filesystem::directory_iterator(power_supply_root)) {
      std::ifstream type_file(entry.path() / "type");
      std::string type;
      if (!type_file.is_open() || !std::getline(type_file, type)) {
        continue;
      }

      if (type == "Battery" && capacity_ == nullptr) {
        capacity_ = std::fopen((entry.path() / "capacity").c_str(), "r");
      } else if (type == "Mains" && ac_online_ == nullptr) {
        ac_online_ = std::fopen((entry.path() / "online").c_str(), "r");
      }
    }
  } catch (const std::filesystem::filesystem_error&) {
    // Whatever was opened before the error stays usable.
  }
}

bool PowerSupplySensor::sample(model::TelemetrySnapshot& snapshot) noexcept {
  raw_ = {};
  bool ok = true;

  long value = 0;
  if (capacity_ != nullptr) {
    if (read_long(capacity_, value)) {
      raw_.capacity_pct = core::clamp_percent(static_cast<double>(value));
    } else {
      ok = false;
    }
  }

  if (ac_online_ != nullptr) {
    if (read_long(ac_online_, value)) {
      raw_.ac_online = value != 0;
    } else {
      ok = false;
    }
  }

  snapshot.battery_percent = raw_.capacity_pct;
  snapshot.power_plugged = raw_.capacity_pct.has_value() ? raw_.ac_online : std::nullopt;
  return ok;
}

const PowerSupplySensor::RawFields& PowerSupplySensor::raw() const noexcept { return raw_; }

bool PowerSupplySensor::read_long(std::FILE* file, long& value) noexcept {
  if (std::fseek(file, 0L, SEEK_SET) != 0) {
    return false;
  }

  long parsed = 0;
  if (std::fscanf(file, "%ld", &parsed) != 1) {
    std::clearerr(file);
    return false;
  }

  value = parsed;
  return true;
}

}  // namespace edge_twin::sensors
