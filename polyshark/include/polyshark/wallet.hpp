#pragma once
#include "polyshark/common.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

namespace polyshark {

struct Position {
  std::string token_id;
  Side side;
  double size;
  double entry_price;
  uint64_t entry_time; // ms
};

// Paper balance sheet. Cash never goes negative: every debit goes through
// deduct(), which refuses unaffordable amounts without touching the balance.
// One Wallet belongs to one simulation; it is not synchronised.
class Wallet {
public:
  explicit Wallet(double starting_balance);

  bool canAfford(double amount) const { return usdc_ >= amount; }
  bool deduct(double amount);
  void credit(double amount) { usdc_ += amount; }

  void recordFee(double fee) { total_fees_paid_ += fee; }
  void recordTrade(bool is_winner);

  // cash + sum(size * price); tokens without a price count as 0
  double equity(const std::unordered_map<std::string, double> &prices) const;
  double pnl(const std::unordered_map<std::string, double> &prices) const;
  double winRate() const;

  // At most one position per token. Opening over an existing one replaces
  // it; the replaced position is returned so the caller can settle it.
  std::optional<Position> openPosition(const std::string &token_id, Side side,
                                       double size, double price,
                                       uint64_t timestamp);

  // Removes the position, credits size * exit_price and returns the
  // realized PnL. nullopt if nothing is open for the token.
  std::optional<double> closePosition(const std::string &token_id,
                                      double exit_price);

  bool hasPosition(const std::string &token_id) const {
    return positions_.count(token_id) > 0;
  }
  const std::unordered_map<std::string, Position> &positions() const {
    return positions_;
  }

  double usdc() const { return usdc_; }
  double startingBalance() const { return starting_balance_; }
  double totalFeesPaid() const { return total_fees_paid_; }
  uint32_t totalTrades() const { return total_trades_; }
  uint32_t winningTrades() const { return winning_trades_; }

private:
  double usdc_;
  std::unordered_map<std::string, Position> positions_;
  double starting_balance_;
  double total_fees_paid_ = 0.0;
  uint32_t total_trades_ = 0;
  uint32_t winning_trades_ = 0;
};

} // namespace polyshark
