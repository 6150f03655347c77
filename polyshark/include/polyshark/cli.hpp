#pragma once
#include "polyshark/common.hpp"
#include <spdlog/common.h>
#include <string>

namespace polyshark {

std::string usage();

// POLYSHARK_BALANCE, POLYSHARK_LOG_LEVEL over the defaults
Config configFromEnv();

// Flags over `base`. Throws std::invalid_argument on an unknown flag, a
// missing or malformed value, or a value outside its range (negative
// balance, non-positive size or legs, unknown log level).
Config parseArgs(int argc, char *argv[], Config base = Config{});

// Like spdlog::level::from_str, but an unknown name is an error instead
// of silently meaning "off"
spdlog::level::level_enum parseLogLevel(const std::string &name);

} // namespace polyshark
