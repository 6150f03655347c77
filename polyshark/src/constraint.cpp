#include "polyshark/constraint.hpp"

namespace polyshark {

ConstraintChecker::ConstraintChecker(double min_spread_threshold)
    : min_spread_threshold_(min_spread_threshold) {}

std::optional<ArbitrageSignal>
ConstraintChecker::checkViolation(const Market &market) const {
  double spread = market.spread();
  if (spread <= min_spread_threshold_)
    return std::nullopt;

  ArbitrageSignal signal;
  signal.market_id = market.id;
  signal.spread = spread;
  signal.edge = spread;
  signal.recommended_side = (market.priceSum() > 1.0) ? Side::SELL : Side::BUY;
  signal.yes_price = market.yesPrice();
  signal.no_price = market.noPrice();
  return signal;
}

} // namespace polyshark
