#pragma once
#include "polyshark/arbitrage.hpp"
#include "polyshark/common.hpp"
#include "polyshark/logger.hpp"
#include "polyshark/snapshot.hpp"
#include "polyshark/wallet.hpp"
#include <string>
#include <unordered_map>

namespace polyshark {

// Paper-trading loop over snapshots.
//
// BUY signal (yes + no < 1): buy both outcome tokens at the same size, the
// smaller of the two fillable sizes capped at Config::trade_size.
// SELL signal (yes + no > 1): unwind any positions held in the market's
// tokens into the bids. Without inventory there is nothing to sell and the
// signal is only journaled. A closed leg is a win when its PnL beats the
// entry and exit taker fees.
class Simulator {
public:
  struct CycleReport {
    int markets_scanned = 0;
    int signals_found = 0;
    int trades_executed = 0; // filled legs
    double elapsed_ms = 0.0;
  };

  Simulator(const Config &config, Wallet &wallet, Logger &logger);

  CycleReport runCycle(const Snapshot &snapshot);

  // Closes every open position at the snapshot midpoint (entry price when
  // the token has no two-sided book). Returns total realized PnL before
  // fees; a position counts as a win only if it beats its entry fee.
  double settle(const Snapshot &snapshot);

  // token_id -> midpoint for every two-sided book
  static std::unordered_map<std::string, double>
  markPrices(const Snapshot &snapshot);

  const ArbitrageDetector &detector() const { return detector_; }
  int cycles() const { return cycle_; }

private:
  int enterPair(const ArbitrageSignal &signal, const Market &market,
                const OrderBook &yes_book, const OrderBook &no_book);
  int unwindPair(const ArbitrageSignal &signal, const Market &market,
                 const Snapshot &snapshot);
  // Taker fee paid when the token was bought; 0 if unknown
  double takeEntryFee(const std::string &token_id);

  Config config_;
  Wallet &wallet_;
  Logger &logger_;
  ArbitrageDetector detector_;
  std::unordered_map<std::string, double> entry_fees_; // token_id -> fee
  int cycle_ = 0;
};

} // namespace polyshark
