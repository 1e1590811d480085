#pragma once
#include <optional>
#include <string>
#include <spdlog/common.h>

namespace ShareMonitor {

// "trace", "debug", "info", "warn", "error", "off"; nullopt when unrecognised
std::optional<spdlog::level::level_enum> parseLogLevel(const std::string& name);

// Installs the default logger: coloured console output plus an optional file
void initLogging(spdlog::level::level_enum level, const std::string& logFile = "");

}
