#pragma once

namespace rfshared::model {

// Power statistics computed from an IQ capture.
struct IQStatistics {
  double average  = 0;
  double max      = 0;
  double median   = 0;
  double stddev   = 0;
  double kurtosis = 0;
};

} // namespace rfshared::model
