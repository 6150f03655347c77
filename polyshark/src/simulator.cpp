#include "polyshark/simulator.hpp"
#include "polyshark/execution.hpp"
#include "polyshark/fees.hpp"
#include "polyshark/fills.hpp"
#include "polyshark/slippage.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>
#include <vector>

namespace polyshark {

Simulator::Simulator(const Config &config, Wallet &wallet, Logger &logger)
    : config_(config), wallet_(wallet), logger_(logger),
      detector_(config.min_spread, config.min_profit,
                CostModel{config.legs}) {}

// ── One scan cycle ───────────────────────────────────────────────────
Simulator::CycleReport Simulator::runCycle(const Snapshot &snapshot) {
  auto start = std::chrono::steady_clock::now();
  cycle_++;

  CycleReport report;
  report.markets_scanned = static_cast<int>(snapshot.markets.size());

  std::unordered_map<std::string, const Market *> by_id;
  for (const auto &m : snapshot.markets)
    by_id[m.id] = &m;

  auto signals = detector_.scan(snapshot.markets);
  report.signals_found = static_cast<int>(signals.size());

  for (const auto &signal : signals) {
    const Market &market = *by_id.at(signal.market_id);

    if (signal.recommended_side == Side::SELL) {
      report.trades_executed += unwindPair(signal, market, snapshot);
      continue;
    }

    const OrderBook *yes_book = snapshot.findBook(market.yesTokenId());
    const OrderBook *no_book = snapshot.findBook(market.noTokenId());
    if (!yes_book || !no_book) {
      spdlog::warn("[Sim] {}: missing order book, skipping", market.id);
      continue;
    }
    report.trades_executed += enterPair(signal, market, *yes_book, *no_book);
  }

  report.elapsed_ms = elapsed_ms(start);
  logger_.logCycle(cycle_, report.markets_scanned, report.signals_found,
                   report.trades_executed, report.elapsed_ms);
  return report;
}

// ── Entry: buy YES + NO ──────────────────────────────────────────────
int Simulator::enterPair(const ArbitrageSignal &signal, const Market &market,
                         const OrderBook &yes_book, const OrderBook &no_book) {
  if (wallet_.hasPosition(yes_book.token_id) ||
      wallet_.hasPosition(no_book.token_id)) {
    spdlog::info("[Sim] {}: already positioned, skipping", market.id);
    return 0;
  }

  // Same size on both legs so the pair stays a complete set
  double size =
      std::min(FillModel::filledSize(yes_book, config_.trade_size, Side::BUY),
               FillModel::filledSize(no_book, config_.trade_size, Side::BUY));
  if (size <= 0.0) {
    spdlog::info("[Sim] {}: no ask liquidity", market.id);
    return 0;
  }

  auto yes_slip = SlippageModel::calculate(yes_book, size, Side::BUY);
  auto no_slip = SlippageModel::calculate(no_book, size, Side::BUY);
  if (!yes_slip || !no_slip) {
    spdlog::info("[Sim] {}: book too thin to price", market.id);
    return 0;
  }

  FeeModel fees = FeeModel::fromMarket(market);
  double slippage = std::max(*yes_slip, *no_slip);
  double expected =
      detector_.expectedProfit(signal, size, fees.takerRate(), slippage);
  bool taken =
      detector_.shouldTrade(signal, size, fees.takerRate(), slippage);
  logger_.logSignal(signal, market, expected, taken);
  if (!taken)
    return 0;

  // Both legs or neither
  double yes_cost = *SlippageModel::executionCost(yes_book, size, Side::BUY);
  double no_cost = *SlippageModel::executionCost(no_book, size, Side::BUY);
  double required = yes_cost + fees.calculate(yes_cost, false) + no_cost +
                    fees.calculate(no_cost, false);
  if (!wallet_.canAfford(required)) {
    spdlog::warn("[Sim] {}: insufficient funds (${:.2f} > ${:.2f})",
                 market.id, required, wallet_.usdc());
    return 0;
  }

  ExecutionEngine engine(fees);
  int filled = 0;
  for (const OrderBook *book : {&yes_book, &no_book}) {
    auto result = engine.execute(*book, size, Side::BUY, wallet_);
    if (!result) {
      spdlog::error("[Sim] {}: leg {} failed after pre-check", market.id,
                    book->token_id);
      continue;
    }
    uint64_t ts = book->timestamp != 0 ? book->timestamp : now_ms();
    wallet_.openPosition(book->token_id, Side::BUY, result->filled_size,
                         result->execution_price, ts);
    entry_fees_[book->token_id] = result->fee_paid;
    logger_.logExecution(market.id, book->token_id, Side::BUY, *result);
    filled++;
  }
  return filled;
}

// ── Exit: sell held YES / NO into the bids ───────────────────────────
int Simulator::unwindPair(const ArbitrageSignal &signal, const Market &market,
                          const Snapshot &snapshot) {
  FeeModel fees = FeeModel::fromMarket(market);
  int filled = 0;
  bool held = false;
  double net_realized = 0.0;

  for (const auto &token_id : {market.yesTokenId(), market.noTokenId()}) {
    auto it = wallet_.positions().find(token_id);
    if (it == wallet_.positions().end())
      continue;
    held = true;

    const Position pos = it->second;
    const OrderBook *book = snapshot.findBook(token_id);
    if (!book) {
      spdlog::warn("[Sim] {}: no book for {}, holding", market.id, token_id);
      continue;
    }

    auto exit_price = book->executionPrice(pos.size, Side::SELL);
    if (!exit_price) {
      spdlog::info("[Sim] {}: bids too thin to exit {:.2f} of {}", market.id,
                   pos.size, token_id);
      continue;
    }

    auto pnl = wallet_.closePosition(token_id, *exit_price);
    if (!pnl)
      continue;

    ExecutionResult result;
    result.filled_size = pos.size;
    result.execution_price = *exit_price;
    result.fee_paid = fees.calculate(pos.size * *exit_price, false);
    if (auto mid = book->midpoint())
      result.slippage = (*mid - *exit_price) / *mid;
    result.total_cost = result.fee_paid;
    result.success = true;

    if (wallet_.deduct(result.fee_paid))
      wallet_.recordFee(result.fee_paid);
    else
      spdlog::warn("[Sim] {}: cannot pay exit fee ${:.4f}", market.id,
                   result.fee_paid);

    double net = *pnl - takeEntryFee(token_id) - result.fee_paid;
    wallet_.recordTrade(net > 0.0);
    net_realized += net;
    logger_.logExecution(market.id, token_id, Side::SELL, result);
    spdlog::info("[Sim] Closed {} on {}: pnl=${:.4f}, net=${:.4f}", token_id,
                 market.id, *pnl, net);
    filled++;
  }

  logger_.logSignal(signal, market, net_realized, held);
  return filled;
}

double Simulator::takeEntryFee(const std::string &token_id) {
  auto it = entry_fees_.find(token_id);
  if (it == entry_fees_.end())
    return 0.0;
  double fee = it->second;
  entry_fees_.erase(it);
  return fee;
}

// ── Settlement ───────────────────────────────────────────────────────
std::unordered_map<std::string, double>
Simulator::markPrices(const Snapshot &snapshot) {
  std::unordered_map<std::string, double> prices;
  for (const auto &[token_id, book] : snapshot.books) {
    if (auto mid = book.midpoint())
      prices[token_id] = *mid;
  }
  return prices;
}

double Simulator::settle(const Snapshot &snapshot) {
  auto marks = markPrices(snapshot);

  std::vector<std::string> open;
  for (const auto &[token_id, pos] : wallet_.positions())
    open.push_back(token_id);

  double realized = 0.0;
  for (const auto &token_id : open) {
    auto it = marks.find(token_id);
    double exit_price = (it != marks.end())
                            ? it->second
                            : wallet_.positions().at(token_id).entry_price;
    if (auto pnl = wallet_.closePosition(token_id, exit_price)) {
      double net = *pnl - takeEntryFee(token_id);
      wallet_.recordTrade(net > 0.0);
      realized += *pnl;
      spdlog::debug("[Sim] Settled {} @ {:.4f}: pnl=${:.4f}, net=${:.4f}",
                    token_id, exit_price, *pnl, net);
    }
  }

  spdlog::info("[Sim] Settled {} position(s), realized=${:.4f}", open.size(),
               realized);
  return realized;
}

} // namespace polyshark
