#include "polyshark/fees.hpp"

namespace polyshark {

FeeModel FeeModel::fromMarket(const Market &market) {
  FeeModel model;
  model.maker_fee_bps = market.maker_base_fee;
  model.taker_fee_bps = market.taker_base_fee;
  return model;
}

double FeeModel::calculate(double notional, bool is_maker) const {
  uint32_t bps = is_maker ? maker_fee_bps : taker_fee_bps;
  return notional * (bps / 10000.0);
}

} // namespace polyshark
