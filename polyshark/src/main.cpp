#include "polyshark/cli.hpp"
#include "polyshark/common.hpp"
#include "polyshark/logger.hpp"
#include "polyshark/simulator.hpp"
#include "polyshark/snapshot.hpp"
#include "polyshark/wallet.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <stdexcept>
#include <string>

using namespace polyshark;

// ── Main pipeline ────────────────────────────────────────────────────
int main(int argc, char *argv[]) {
  auto console = spdlog::stdout_color_mt("polyshark");
  spdlog::set_default_logger(console);
  spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

  Config cfg;
  try {
    cfg = parseArgs(argc, argv, configFromEnv());
  } catch (const std::invalid_argument &e) {
    spdlog::error("Bad arguments: {}", e.what());
    std::cout << usage();
    return 2;
  }
  if (cfg.help) {
    std::cout << usage();
    return 0;
  }
  spdlog::set_level(parseLogLevel(cfg.log_level));

  if (cfg.snapshot_path.empty()) {
    spdlog::error("--snapshot is required");
    std::cout << usage();
    return 2;
  }

  spdlog::info("Balance: ${:.2f}", cfg.starting_balance);
  spdlog::info("Size/leg: {:.2f}", cfg.trade_size);
  spdlog::info("Min spread: {:.4f}", cfg.min_spread);
  spdlog::info("Min profit: ${:.2f}", cfg.min_profit);
  spdlog::info("Fee legs: {}", cfg.legs);

  try {
    auto cycles = loadSnapshots(cfg.snapshot_path);
    if (cycles.empty()) {
      spdlog::warn("Snapshot file holds no cycles");
      return 0;
    }

    Wallet wallet(cfg.starting_balance);
    Logger logger(cfg.log_dir);
    Simulator sim(cfg, wallet, logger);

    for (const auto &snap : cycles) {
      auto marks = Simulator::markPrices(snap);
      sim.runCycle(snap);
      spdlog::info("Equity ${:.2f}, open positions {}", wallet.equity(marks),
                   wallet.positions().size());
    }

    sim.settle(cycles.back());

    spdlog::info("══════════════════════════════════════════════");
    spdlog::info("Cycles:       {}", sim.cycles());
    spdlog::info("Cash:         ${:.2f}", wallet.usdc());
    spdlog::info("PnL:          ${:.2f}", wallet.pnl({}));
    spdlog::info("Fees paid:    ${:.4f}", wallet.totalFeesPaid());
    spdlog::info("Trades:       {} ({} winners, {:.1f}%)",
                 wallet.totalTrades(), wallet.winningTrades(),
                 wallet.winRate() * 100);
    spdlog::info("══════════════════════════════════════════════");
  } catch (const std::exception &e) {
    spdlog::error("Simulation failed: {}", e.what());
    return 1;
  }

  return 0;
}
