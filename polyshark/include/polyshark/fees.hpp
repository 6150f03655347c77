#pragma once
#include "polyshark/common.hpp"
#include <cstdint>

namespace polyshark {

// Basis-point fee schedule (Polymarket: maker usually 0, taker ~200)
struct FeeModel {
  uint32_t maker_fee_bps = 0;
  uint32_t taker_fee_bps = 0;

  static FeeModel fromMarket(const Market &market);

  double calculate(double notional, bool is_maker) const;

  double makerRate() const { return maker_fee_bps / 10000.0; }
  double takerRate() const { return taker_fee_bps / 10000.0; }
};

} // namespace polyshark
