#pragma once
#include <ctime>
#include <string>

namespace ShareMonitor {

constexpr const char* kNotAvailable = "N/A";

// "$1,234.56"
std::string formatPrice(double value);

// "+1.23% ↑" / "-0.50% ↓"
std::string formatChangePct(double pct);

// "$+0.45 ↑"; the arrow follows the percentage so both halves of a pair agree
std::string formatChangeAbs(double abs, double pct);

// Local wall-clock "HH:MM:SS"
std::string formatClock(std::time_t when);

// "BHP.AX_20261019_143005.png", or "MainMonitor_..." for the combined chart
std::string exportFileName(const std::string& symbol, std::time_t when);

}
