#include "polyshark/execution.hpp"
#include "polyshark/fills.hpp"
#include <cmath>
#include <spdlog/spdlog.h>

namespace polyshark {

ExecutionEngine::ExecutionEngine(const FeeModel &fee_model)
    : fee_model_(fee_model) {}

std::optional<ExecutionResult> ExecutionEngine::execute(const OrderBook &book,
                                                        double size, Side side,
                                                        Wallet &wallet) const {
  // ── 1. Fill ──
  double filled_size = FillModel::filledSize(book, size, side);
  if (filled_size <= 0.0) {
    spdlog::debug("[Exec] {} {}: no liquidity", sideName(side), book.token_id);
    return std::nullopt;
  }

  // ── 2. Price ──
  auto exec_price = book.executionPrice(filled_size, side);
  if (!exec_price) {
    spdlog::debug("[Exec] {} {}: book exhausted at {:.2f}", sideName(side),
                  book.token_id, filled_size);
    return std::nullopt;
  }
  auto mid = book.midpoint();
  if (!mid) {
    spdlog::debug("[Exec] {} {}: one-sided book, no midpoint", sideName(side),
                  book.token_id);
    return std::nullopt;
  }
  double slippage = std::abs((*exec_price - *mid) / *mid);

  // ── 3. Costs ──
  double notional = *exec_price * filled_size;
  double fee = fee_model_.calculate(notional, false); // taker
  double total_cost = notional + fee;

  // ── 4. Funds ──
  if (!wallet.deduct(total_cost)) {
    spdlog::debug("[Exec] {} {}: insufficient funds (${:.2f} > ${:.2f})",
                  sideName(side), book.token_id, total_cost, wallet.usdc());
    return std::nullopt;
  }
  wallet.recordFee(fee);

  ExecutionResult result;
  result.filled_size = filled_size;
  result.execution_price = *exec_price;
  result.fee_paid = fee;
  result.slippage = slippage;
  result.total_cost = total_cost;
  result.success = true;

  spdlog::debug("[Exec] {} {} {:.2f} @ {:.4f}, fee=${:.4f}, slip={:.4f}",
                sideName(side), book.token_id, filled_size, *exec_price, fee,
                slippage);
  return result;
}

} // namespace polyshark
