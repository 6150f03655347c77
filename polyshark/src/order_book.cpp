#include "polyshark/common.hpp"
#include <algorithm>
#include <cmath>

namespace polyshark {

// Residue tolerated when a walk consumes exactly the resting depth
constexpr double FILL_EPS = 1e-12;

double Market::spread() const { return std::abs(priceSum() - 1.0); }

std::optional<double> OrderBook::midpoint() const {
  auto bid = bestBid();
  auto ask = bestAsk();
  if (!bid || !ask)
    return std::nullopt;
  return (*bid + *ask) / 2.0;
}

double OrderBook::totalBidLiquidity() const {
  double total = 0.0;
  for (const auto &level : bids)
    total += level.size;
  return total;
}

double OrderBook::totalAskLiquidity() const {
  double total = 0.0;
  for (const auto &level : asks)
    total += level.size;
  return total;
}

// ── VWAP walk ────────────────────────────────────────────────────────
std::optional<double> OrderBook::executionPrice(double size, Side side) const {
  const auto &levels = (side == Side::BUY) ? asks : bids;

  double remaining = size;
  double total_notional = 0.0;

  for (const auto &level : levels) {
    if (remaining <= size * FILL_EPS)
      break;
    double fill = std::min(remaining, level.size);
    total_notional += fill * level.price;
    remaining -= fill;
  }

  if (remaining > size * FILL_EPS)
    return std::nullopt; // book exhausted

  return total_notional / size;
}

} // namespace polyshark
