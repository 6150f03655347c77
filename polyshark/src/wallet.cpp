#include "polyshark/wallet.hpp"
#include <spdlog/spdlog.h>

namespace polyshark {

Wallet::Wallet(double starting_balance)
    : usdc_(starting_balance), starting_balance_(starting_balance) {}

bool Wallet::deduct(double amount) {
  if (!canAfford(amount))
    return false;
  usdc_ -= amount;
  return true;
}

void Wallet::recordTrade(bool is_winner) {
  total_trades_++;
  if (is_winner)
    winning_trades_++;
}

// ── Valuation ────────────────────────────────────────────────────────
double
Wallet::equity(const std::unordered_map<std::string, double> &prices) const {
  double position_value = 0.0;
  for (const auto &[token_id, pos] : positions_) {
    auto it = prices.find(token_id);
    double price = (it != prices.end()) ? it->second : 0.0;
    position_value += pos.size * price;
  }
  return usdc_ + position_value;
}

double
Wallet::pnl(const std::unordered_map<std::string, double> &prices) const {
  return equity(prices) - starting_balance_;
}

double Wallet::winRate() const {
  if (total_trades_ == 0)
    return 0.0;
  return static_cast<double>(winning_trades_) / total_trades_;
}

// ── Positions ────────────────────────────────────────────────────────
std::optional<Position> Wallet::openPosition(const std::string &token_id,
                                             Side side, double size,
                                             double price, uint64_t timestamp) {
  std::optional<Position> replaced;
  auto it = positions_.find(token_id);
  if (it != positions_.end()) {
    replaced = it->second;
    spdlog::warn("[Wallet] Replacing open {} position on {} ({:.2f} @ {:.4f})",
                 sideName(it->second.side), token_id, it->second.size,
                 it->second.entry_price);
  }

  positions_[token_id] = Position{token_id, side, size, price, timestamp};
  return replaced;
}

std::optional<double> Wallet::closePosition(const std::string &token_id,
                                            double exit_price) {
  auto it = positions_.find(token_id);
  if (it == positions_.end())
    return std::nullopt;

  Position pos = it->second;
  positions_.erase(it);

  double pnl = (pos.side == Side::BUY)
                   ? (exit_price - pos.entry_price) * pos.size
                   : (pos.entry_price - exit_price) * pos.size;
  credit(pos.size * exit_price);
  return pnl;
}

} // namespace polyshark
