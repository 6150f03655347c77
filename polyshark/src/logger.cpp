#include "polyshark/logger.hpp"
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <spdlog/spdlog.h>
#include <sstream>
#include <stdexcept>

namespace polyshark {

namespace fs = std::filesystem;

static constexpr const char *SIGNAL_HEADER =
    "timestamp,market_id,side,yes_price,no_price,spread,net_profit,taken";
static constexpr const char *EXEC_HEADER =
    "timestamp,market_id,token_id,side,filled_size,execution_price,fee,"
    "slippage,total_cost";

// UTC, millisecond resolution
static std::string journalTime() {
  auto now = std::chrono::system_clock::now();
  std::time_t secs = std::chrono::system_clock::to_time_t(now);
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                    now.time_since_epoch())
                    .count() %
                1000;
  std::tm utc{};
  gmtime_r(&secs, &utc);

  std::ostringstream out;
  out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0')
      << std::setw(3) << millis << 'Z';
  return out.str();
}

// Appends to `path`, writing `header` only into a fresh file
static void openJournal(std::ofstream &stream, const fs::path &path,
                        const char *header) {
  bool fresh = !fs::exists(path) || fs::file_size(path) == 0;
  stream.open(path, std::ios::app);
  if (!stream.is_open())
    throw std::runtime_error("cannot open journal " + path.string());
  if (fresh)
    stream << header << '\n' << std::flush;
}

Logger::Logger(const std::string &log_dir) : log_dir_(log_dir) {
  fs::create_directories(log_dir_);
  openJournal(signal_csv_, fs::path(log_dir_) / "signals.csv", SIGNAL_HEADER);
  openJournal(exec_csv_, fs::path(log_dir_) / "executions.csv", EXEC_HEADER);
}

void Logger::logSignal(const ArbitrageSignal &signal, const Market &market,
                       double net_profit, bool taken) {
  std::lock_guard<std::mutex> lock(mtx_);

  signal_csv_ << journalTime() << "," << signal.market_id << ","
              << sideName(signal.recommended_side) << "," << std::fixed
              << std::setprecision(4) << signal.yes_price << ","
              << signal.no_price << "," << signal.spread << ","
              << std::setprecision(6) << net_profit << "," << (taken ? 1 : 0)
              << std::endl;

  spdlog::info("[Signal] {} {}: YES={:.3f} NO={:.3f} spread={:.2f}% "
               "net=${:.4f}{}",
               sideName(signal.recommended_side), market.question.substr(0, 60),
               signal.yes_price, signal.no_price, signal.spread * 100,
               net_profit, taken ? "" : " (skipped)");
}

void Logger::logExecution(const std::string &market_id,
                          const std::string &token_id, Side side,
                          const ExecutionResult &result) {
  std::lock_guard<std::mutex> lock(mtx_);

  exec_csv_ << journalTime() << "," << market_id << "," << token_id << ","
            << sideName(side) << "," << std::fixed << std::setprecision(4)
            << result.filled_size << "," << std::setprecision(6)
            << result.execution_price << "," << result.fee_paid << ","
            << result.slippage << "," << result.total_cost << std::endl;

  spdlog::info("[Fill] {} {} x {:.2f} @ {:.4f}, fee=${:.4f}, cost=${:.2f}",
               sideName(side), token_id.substr(0, 12), result.filled_size,
               result.execution_price, result.fee_paid, result.total_cost);
}

void Logger::logCycle(int cycle, int markets_scanned, int signals_found,
                      int trades_executed, double elapsed) {
  spdlog::info("── Cycle {} ── markets={}, signals={}, trades={}, "
               "elapsed={:.1f}ms ──",
               cycle, markets_scanned, signals_found, trades_executed,
               elapsed);
}

} // namespace polyshark
