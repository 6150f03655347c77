#include "polyshark/slippage.hpp"

namespace polyshark {

std::optional<double> SlippageModel::calculate(const OrderBook &book,
                                               double size, Side side) {
  auto mid = book.midpoint();
  if (!mid)
    return std::nullopt;
  auto exec_price = book.executionPrice(size, side);
  if (!exec_price)
    return std::nullopt;

  if (side == Side::BUY)
    return (*exec_price - *mid) / *mid;
  return (*mid - *exec_price) / *mid;
}

std::optional<double> SlippageModel::executionCost(const OrderBook &book,
                                                   double size, Side side) {
  auto exec_price = book.executionPrice(size, side);
  if (!exec_price)
    return std::nullopt;
  return *exec_price * size;
}

} // namespace polyshark
