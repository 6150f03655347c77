#include "polyshark/cli.hpp"
#include <cstdlib>
#include <stdexcept>

namespace polyshark {

std::string usage() {
  return R"(
PolyShark — binary market arbitrage simulator

Usage: polyshark --snapshot <FILE> [OPTIONS]

Options:
  --snapshot <FILE>     JSON snapshot: one cycle or an array of cycles
  --balance <USD>       Starting paper balance, >= 0 (default: 1000)
  --size <SHARES>       Shares per leg, > 0 (default: 100)
  --min-spread <X>      Minimum |yes + no - 1| to signal (default: 0.02)
  --min-profit <USD>    Minimum net profit to trade (default: 0.50)
  --legs <N>            Legs charged in the fee estimate, >= 1 (default: 2)
  --log-dir <DIR>       Trade journal directory (default: logs)
  --log-level <LEVEL>   trace|debug|info|warn|error|critical|off (default: info)
  --help, -h            Show this help

Environment:
  POLYSHARK_BALANCE     Starting paper balance
  POLYSHARK_LOG_LEVEL   Log level
)";
}

// ── Value parsers ────────────────────────────────────────────────────
static double parseNumber(const std::string &flag, const std::string &text) {
  size_t used = 0;
  double value = 0.0;
  try {
    value = std::stod(text, &used);
  } catch (const std::logic_error &) {
    used = 0;
  }
  if (used == 0 || used != text.size())
    throw std::invalid_argument(flag + ": not a number: '" + text + "'");
  return value;
}

// std::stoul accepts "-1" and wraps it
static unsigned parseCount(const std::string &flag, const std::string &text) {
  if (text.empty() || text[0] == '-' || text[0] == '+')
    throw std::invalid_argument(flag + ": expected a positive integer, got '" +
                                text + "'");
  size_t used = 0;
  unsigned long value = 0;
  try {
    value = std::stoul(text, &used);
  } catch (const std::logic_error &) {
    used = 0;
  }
  if (used == 0 || used != text.size() || value == 0 || value > 1000)
    throw std::invalid_argument(flag + ": expected a positive integer, got '" +
                                text + "'");
  return static_cast<unsigned>(value);
}

spdlog::level::level_enum parseLogLevel(const std::string &name) {
  auto level = spdlog::level::from_str(name);
  if (level == spdlog::level::off && name != "off")
    throw std::invalid_argument("unknown log level: '" + name + "'");
  return level;
}

static void validate(const Config &cfg) {
  if (cfg.starting_balance < 0.0)
    throw std::invalid_argument("starting balance must be >= 0");
  if (cfg.trade_size <= 0.0)
    throw std::invalid_argument("--size must be positive");
  parseLogLevel(cfg.log_level);
}

// ── Environment ──────────────────────────────────────────────────────
Config configFromEnv() {
  Config cfg;
  if (auto *v = std::getenv("POLYSHARK_BALANCE"))
    cfg.starting_balance = parseNumber("POLYSHARK_BALANCE", v);
  if (auto *v = std::getenv("POLYSHARK_LOG_LEVEL"))
    cfg.log_level = v;
  return cfg;
}

// ── Flags ────────────────────────────────────────────────────────────
Config parseArgs(int argc, char *argv[], Config cfg) {
  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      cfg.help = true;
      return cfg;
    }
    if (i + 1 >= argc)
      throw std::invalid_argument("unknown or incomplete option: " + arg);
    std::string value = argv[++i];

    if (arg == "--snapshot")
      cfg.snapshot_path = value;
    else if (arg == "--balance")
      cfg.starting_balance = parseNumber(arg, value);
    else if (arg == "--size")
      cfg.trade_size = parseNumber(arg, value);
    else if (arg == "--min-spread")
      cfg.min_spread = parseNumber(arg, value);
    else if (arg == "--min-profit")
      cfg.min_profit = parseNumber(arg, value);
    else if (arg == "--legs")
      cfg.legs = parseCount(arg, value);
    else if (arg == "--log-dir")
      cfg.log_dir = value;
    else if (arg == "--log-level")
      cfg.log_level = value;
    else
      throw std::invalid_argument("unknown option: " + arg);
  }

  validate(cfg);
  return cfg;
}

} // namespace polyshark
