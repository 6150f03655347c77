#pragma once
#include "polyshark/common.hpp"

namespace polyshark {

// Estimates how much of an order the resting liquidity can absorb
class FillModel {
public:
  // 1.0 when the opposite side covers `size`, otherwise available / size
  static double estimateFillRatio(const OrderBook &book, double size,
                                  Side side);

  static double filledSize(const OrderBook &book, double requested_size,
                           Side side);
};

} // namespace polyshark
