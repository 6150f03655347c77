#pragma once
#include "polyshark/common.hpp"
#include <optional>

namespace polyshark {

class SlippageModel {
public:
  // Signed deviation of the VWAP from the midpoint, positive when the fill
  // is worse than mid. nullopt if either side is empty or the book cannot
  // absorb `size`.
  static std::optional<double> calculate(const OrderBook &book, double size,
                                         Side side);

  // VWAP * size
  static std::optional<double> executionCost(const OrderBook &book,
                                             double size, Side side);
};

} // namespace polyshark
