#include "utils/Format.hpp"
#include <cmath>
#include <cstdio>

namespace ShareMonitor {

namespace {

const char* kUpArrow = " ↑";
const char* kDownArrow = " ↓";

const char* arrowFor(double pct) {
    return pct >= 0.0 ? kUpArrow : kDownArrow;
}

std::string groupThousands(const std::string& digits) {
    std::string out;
    int count = 0;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        if (count > 0 && count % 3 == 0) out.insert(out.begin(), ',');
        out.insert(out.begin(), *it);
        ++count;
    }
    return out;
}

std::string formatLocalTime(std::time_t when, const char* pattern) {
    std::tm local{};
    localtime_r(&when, &local);
    char buf[64];
    size_t n = std::strftime(buf, sizeof(buf), pattern, &local);
    return std::string(buf, n);
}

}

std::string formatPrice(double value) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.2f", std::fabs(value));
    std::string text(buf);
    size_t dot = text.find('.');
    std::string whole = groupThousands(text.substr(0, dot));
    std::string result = "$";
    if (value < 0.0 && std::fabs(value) >= 0.005) result += "-";
    return result + whole + text.substr(dot);
}

std::string formatChangePct(double pct) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%+.2f%%", pct);
    return std::string(buf) + arrowFor(pct);
}

std::string formatChangeAbs(double abs, double pct) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "$%+.2f", abs);
    return std::string(buf) + arrowFor(pct);
}

std::string formatClock(std::time_t when) {
    return formatLocalTime(when, "%H:%M:%S");
}

std::string exportFileName(const std::string& symbol, std::time_t when) {
    std::string base = symbol.empty() ? "MainMonitor" : symbol;
    return base + "_" + formatLocalTime(when, "%Y%m%d_%H%M%S") + ".png";
}

}
