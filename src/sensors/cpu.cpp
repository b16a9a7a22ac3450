#include "sensors/cpu.hpp"

#include <cerrno>
#include <cstddef>
#include <cstdlib>
#include <cstring>

namespace edge_twin::sensors {
namespace {

constexpr std::size_t kStatLineSize = 512;

// user nice system idle iowait irq softirq steal
constexpr std::size_t kTickFields = 8;

}  // namespace

bool parse_cpu_ticks(const char* line, CpuTicks& ticks) noexcept {
  if (std::strncmp(line, "cpu ", 4) != 0) {
    return false;
  }

  std::uint64_t fields[kTickFields]{};
  const char* cursor = line + 4;
  std::size_t parsed = 0;
  while (parsed < kTickFields) {
    char* end = nullptr;
    errno = 0;
    const unsigned long long value = std::strtoull(cursor, &end, 10);
    if (end == cursor) {
      break;
    }
    if (errno != 0) {
      return false;
    }
    fields[parsed++] = value;
    cursor = end;
  }

  // Kernels before 2.6 stop after idle.
  if (parsed < 4) {
    return false;
  }

  ticks.idle = fields[3] + fields[4];
  ticks.busy = fields[0] + fields[1] + fields[2] + fields[5] + fields[6] + fields[7];
  return true;
}

CpuSensor::CpuSensor() : file_(std::fopen("/proc/stat", "r")), owns_file_(true) {}

CpuSensor::CpuSensor(std::FILE* file, const bool owns_file) : file_(file), owns_file_(owns_file) {}

CpuSensor::~CpuSensor() {
  if (owns_file_ && file_ != nullptr) {
    std::fclose(file_);
  }
}

bool CpuSensor::sample(model::TelemetrySnapshot& snapshot) noexcept {
  snapshot.cpu_percent = 0.0;
  if (file_ == nullptr || std::fseek(file_, 0L, SEEK_SET) != 0) {
    return false;
  }

  char line[kStatLineSize]{};
  if (std::fgets(line, static_cast<int>(sizeof(line)), file_) == nullptr) {
    std::clearerr(file_);
    return false;
  }

  CpuTicks current{};
  if (!parse_cpu_ticks(line, current)) {
    return false;
  }

  const CpuTicks previous = previous_;
  const bool primed = primed_;
  previous_ = current;
  primed_ = true;
  if (!primed || current.total() <= previous.total() || current.idle < previous.idle) {
    return true;
  }

  const std::uint64_t total_delta = current.total() - previous.total();
  const std::uint64_t idle_delta = current.idle - previous.idle;
  const std::uint64_t busy_delta = total_delta > idle_delta ? total_delta - idle_delta : 0;
  snapshot.cpu_percent = static_cast<double>(busy_delta) / static_cast<double>(total_delta) * 100.0;
  return true;
}

}  // namespace edge_twin::sensors
