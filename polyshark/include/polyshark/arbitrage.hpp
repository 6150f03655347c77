#pragma once
#include "polyshark/common.hpp"
#include "polyshark/constraint.hpp"
#include <vector>

namespace polyshark {

// Fee assumptions for the profitability estimate. A binary arb is two
// offsetting legs, each charged at the YES price basis.
struct CostModel {
  unsigned legs = 2;
};

class ArbitrageDetector {
public:
  ArbitrageDetector(double min_spread, double min_profit,
                    CostModel cost_model = CostModel{});

  // Signals for every active, order-accepting market, in input order
  std::vector<ArbitrageSignal> scan(const std::vector<Market> &markets) const;

  // edge*size - size*yes*fee_rate*legs - size*slippage
  double expectedProfit(const ArbitrageSignal &signal, double size,
                        double fee_rate, double slippage) const;

  // Net profit must strictly exceed the minimum
  bool shouldTrade(const ArbitrageSignal &signal, double size, double fee_rate,
                   double slippage) const;

  const ConstraintChecker &constraintChecker() const { return checker_; }
  double minProfitThreshold() const { return min_profit_threshold_; }
  const CostModel &costModel() const { return cost_model_; }

private:
  ConstraintChecker checker_;
  double min_profit_threshold_;
  CostModel cost_model_;
};

} // namespace polyshark
