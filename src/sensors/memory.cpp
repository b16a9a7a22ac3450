#include "sensors/memory.hpp"

#include <cstring>

#include "core/math.hpp"

namespace edge_twin::sensors {

MemorySensor::MemorySensor() : meminfo_(std::fopen("/proc/meminfo", "r")) {}

MemorySensor::MemorySensor(std::FILE* meminfo, const bool owns_file) : meminfo_(meminfo), owns_file_(owns_file) {}

MemorySensor::~MemorySensor() {
  if (owns_file_ && meminfo_ != nullptr) {
    std::fclose(meminfo_);
    meminfo_ = nullptr;
  }
}

bool MemorySensor::sample(model::TelemetrySnapshot& snapshot) noexcept {
  if (!parse_meminfo()) {
    snapshot.memory_percent = 0.0;
    return false;
  }

  const std::uint64_t available = raw_.mem_available_kb > raw_.mem_total_kb ? raw_.mem_total_kb : raw_.mem_available_kb;
  const double used = static_cast<double>(raw_.mem_total_kb - available);
  snapshot.memory_percent = core::clamp_percent((used / static_cast<double>(raw_.mem_total_kb)) * 100.0);
  return true;
}

const MemorySensor::RawFields& MemorySensor::raw() const noexcept { return raw_; }

bool MemorySensor::parse_meminfo() noexcept {
  if (meminfo_ == nullptr) {
    return false;
  }

  if (std::fseek(meminfo_, 0L, SEEK_SET) != 0) {
    return false;
  }

  raw_ = {};
  bool has_available = false;

  char buffer[kReadBufferSize]{};
  while (std::fgets(buffer, static_cast<int>(sizeof(buffer)), meminfo_) != nullptr) {
    char key[64]{};
    unsigned long long value = 0;
    if (std::sscanf(buffer, "%63[^:]: %llu kB", key, &value) != 2) {
      continue;
    }

    if (std::strcmp(key, "MemTotal") == 0) {
      raw_.mem_total_kb = value;
    } else if (std::strcmp(key, "MemAvailable") == 0) {
      raw_.mem_available_kb = value;
      has_available = true;
    } else if (std::strcmp(key, "MemFree") == 0) {
      raw_.mem_free_kb = value;
    } else if (std::strcmp(key, "Buffers") == 0) {
      raw_.buffers_kb = value;
    } else if (std::strcmp(key, "Cached") == 0) {
      raw_.cached_kb = value;
    }
  }

  if (std::ferror(meminfo_) != 0) {
    std::clearerr(meminfo_);
    return false;
  }

  // Kernels before 3.14 have no MemAvailable.
  if (!has_available) {
    raw_.mem_available_kb = raw_.mem_free_kb + raw_.buffers_kb + raw_.cached_kb;
  }

  return raw_.mem_total_kb != 0;
}

}  // namespace edge_twin::sensors
