#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace polyshark {

// ── Configuration ────────────────────────────────────────────────────
struct Config {
  std::string snapshot_path;       // JSON snapshot (one cycle or an array)
  double starting_balance = 1000.0; // paper USDC
  double trade_size = 100.0;        // shares per leg
  double min_spread = 0.02;         // |yes + no - 1| must exceed this
  double min_profit = 0.50;         // net USD after fees + slippage
  unsigned legs = 2;                // legs charged in the fee estimate
  std::string log_dir = "logs";
  std::string log_level = "info";
  bool help = false;
};

// ── Order side ───────────────────────────────────────────────────────
enum class Side { BUY, SELL };

inline const char *sideName(Side side) {
  return side == Side::BUY ? "BUY" : "SELL";
}

// ── Market Data ──────────────────────────────────────────────────────
// Binary market snapshot. outcomes[0] / outcome_prices[0] is YES.
struct Market {
  std::string id;
  std::string question;
  std::string slug;
  std::vector<std::string> outcomes;       // ["Yes", "No"]
  std::vector<double> outcome_prices;      // [0.5, 0.5]
  std::vector<std::string> clob_token_ids; // parallel to outcomes
  std::optional<double> best_bid;
  std::optional<double> best_ask;
  uint32_t maker_base_fee = 0; // bps
  uint32_t taker_base_fee = 0; // bps, e.g. 200 = 2%
  double liquidity = 0.0;
  double volume_24hr = 0.0;
  bool active = true;
  bool accepting_orders = true;

  double yesPrice() const { return outcome_prices[0]; }
  double noPrice() const { return outcome_prices[1]; }
  double priceSum() const { return yesPrice() + noPrice(); }

  // Absolute deviation of the outcome price sum from 1.0
  double spread() const;
  bool isBalanced(double tolerance = 1e-9) const {
    return spread() <= tolerance;
  }

  std::string yesTokenId() const {
    return clob_token_ids.size() > 0 ? clob_token_ids[0] : std::string();
  }
  std::string noTokenId() const {
    return clob_token_ids.size() > 1 ? clob_token_ids[1] : std::string();
  }
};

struct PriceLevel {
  double price;
  double size;
};

// Bids best-first (descending), asks best-first (ascending). The producer
// is responsible for ordering; nothing here sorts.
struct OrderBook {
  std::string token_id;
  std::vector<PriceLevel> bids;
  std::vector<PriceLevel> asks;
  uint64_t timestamp = 0; // ms

  std::optional<double> bestBid() const {
    if (bids.empty())
      return std::nullopt;
    return bids.front().price;
  }
  std::optional<double> bestAsk() const {
    if (asks.empty())
      return std::nullopt;
    return asks.front().price;
  }
  std::optional<double> midpoint() const;

  double totalBidLiquidity() const;
  double totalAskLiquidity() const;

  // Volume-weighted price for walking `size` through the book.
  // Buy walks asks, Sell walks bids. nullopt if the book runs dry.
  std::optional<double> executionPrice(double size, Side side) const;
};

// ── Arbitrage ────────────────────────────────────────────────────────
struct ArbitrageSignal {
  std::string market_id;
  double spread; // |yes + no - 1|
  double edge;   // gross profit per unit before costs
  Side recommended_side;
  double yes_price;
  double no_price;
};

// ── Execution ────────────────────────────────────────────────────────
struct ExecutionResult {
  double filled_size = 0.0;
  double execution_price = 0.0; // VWAP
  double fee_paid = 0.0;
  double slippage = 0.0; // fraction of midpoint
  double total_cost = 0.0;
  bool success = false;
};

// ── Timing helpers ───────────────────────────────────────────────────
inline double elapsed_ms(std::chrono::steady_clock::time_point start) {
  auto now = std::chrono::steady_clock::now();
  return std::chrono::duration<double, std::milli>(now - start).count();
}

inline uint64_t now_ms() {
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

} // namespace polyshark
