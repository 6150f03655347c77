#include "polyshark/fills.hpp"
#include <algorithm>

namespace polyshark {

double FillModel::estimateFillRatio(const OrderBook &book, double size,
                                    Side side) {
  double available = (side == Side::BUY) ? book.totalAskLiquidity()
                                         : book.totalBidLiquidity();
  if (available >= size)
    return 1.0;
  return available / size;
}

double FillModel::filledSize(const OrderBook &book, double requested_size,
                             Side side) {
  double ratio = estimateFillRatio(book, requested_size, side);
  if (ratio >= 1.0)
    return requested_size;
  // requested * (available / requested) can round past the book depth
  double available = (side == Side::BUY) ? book.totalAskLiquidity()
                                         : book.totalBidLiquidity();
  return std::min(requested_size * ratio, available);
}

} // namespace polyshark
