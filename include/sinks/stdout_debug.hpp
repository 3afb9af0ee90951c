#pragma once

#include "model/reading.hpp"

namespace kth_logger::sinks {

class StdoutDebugSink {
 public:
  void publish(const model::ReadingBatch& batch) const;
};

}  // namespace kth_logger::sinks
