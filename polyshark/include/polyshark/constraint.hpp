#pragma once
#include "polyshark/common.hpp"
#include <optional>

namespace polyshark {

// Binary market constraint: P(yes) + P(no) = 1
class ConstraintChecker {
public:
  explicit ConstraintChecker(double min_spread_threshold);

  // Emits a signal when |yes + no - 1| exceeds the threshold.
  // Sum above 1 recommends SELL, below 1 recommends BUY.
  std::optional<ArbitrageSignal> checkViolation(const Market &market) const;

  double minSpreadThreshold() const { return min_spread_threshold_; }

private:
  double min_spread_threshold_;
};

} // namespace polyshark
