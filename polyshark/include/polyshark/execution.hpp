#pragma once
#include "polyshark/common.hpp"
#include "polyshark/fees.hpp"
#include "polyshark/wallet.hpp"
#include <optional>

namespace polyshark {

class ExecutionEngine {
public:
  explicit ExecutionEngine(const FeeModel &fee_model);

  // Simulate a taker order against one book, paid from `wallet`.
  // nullopt when nothing fills, the book cannot absorb the fillable size,
  // there is no midpoint, or the wallet cannot cover notional + fee.
  // On nullopt the wallet is untouched.
  std::optional<ExecutionResult> execute(const OrderBook &book, double size,
                                         Side side, Wallet &wallet) const;

  const FeeModel &feeModel() const { return fee_model_; }

private:
  FeeModel fee_model_;
};

} // namespace polyshark
