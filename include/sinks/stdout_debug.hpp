#pragma once

#include <string>

#include "core/cycle_record.hpp"

namespace edge_twin::sinks {

class StdoutDebugSink {
 public:
  // "[scan] mode=.. scenario=.. cpu=.. ..." without the trailing newline.
  static std::string format(const core::CycleRecord& record);

  void publish(const core::CycleRecord& record) const;
};

}  // namespace edge_twin::sinks
