#pragma once
#include "polyshark/common.hpp"
#include <fstream>
#include <mutex>
#include <string>

namespace polyshark {

// CSV trade journal (signals.csv, executions.csv) mirrored to spdlog.
// net_profit is the gated estimate for entries and the realized figure,
// after entry and exit fees, for unwinds.
class Logger {
public:
  explicit Logger(const std::string &log_dir = "logs");

  void logSignal(const ArbitrageSignal &signal, const Market &market,
                 double net_profit, bool taken);
  void logExecution(const std::string &market_id, const std::string &token_id,
                    Side side, const ExecutionResult &result);
  void logCycle(int cycle, int markets_scanned, int signals_found,
                int trades_executed, double elapsed_ms);

private:
  std::string log_dir_;
  std::ofstream signal_csv_;
  std::ofstream exec_csv_;
  std::mutex mtx_;
};

} // namespace polyshark
