#include "polyshark/arbitrage.hpp"
#include <spdlog/spdlog.h>

namespace polyshark {

ArbitrageDetector::ArbitrageDetector(double min_spread, double min_profit,
                                     CostModel cost_model)
    : checker_(min_spread), min_profit_threshold_(min_profit),
      cost_model_(cost_model) {}

// ── Scan ─────────────────────────────────────────────────────────────
std::vector<ArbitrageSignal>
ArbitrageDetector::scan(const std::vector<Market> &markets) const {
  std::vector<ArbitrageSignal> signals;
  for (const auto &m : markets) {
    if (!m.active || !m.accepting_orders)
      continue;
    if (auto signal = checker_.checkViolation(m))
      signals.push_back(std::move(*signal));
  }

  spdlog::debug("[Arb] Scanned {} markets, {} signals", markets.size(),
                signals.size());
  return signals;
}

// ── Profitability ────────────────────────────────────────────────────
double ArbitrageDetector::expectedProfit(const ArbitrageSignal &signal,
                                         double size, double fee_rate,
                                         double slippage) const {
  double gross = signal.edge * size;
  double fee_cost = size * signal.yes_price * fee_rate * cost_model_.legs;
  double slippage_cost = size * slippage;
  return gross - fee_cost - slippage_cost;
}

bool ArbitrageDetector::shouldTrade(const ArbitrageSignal &signal, double size,
                                    double fee_rate, double slippage) const {
  double net = expectedProfit(signal, size, fee_rate, slippage);
  spdlog::debug("[Arb] {}: edge={:.4f}, size={:.2f}, net=${:.4f}, min=${:.2f}",
                signal.market_id, signal.edge, size, net,
                min_profit_threshold_);
  return net > min_profit_threshold_;
}

} // namespace polyshark
