#include <iostream>
#include <string>
#include "utils/Format.hpp"

using namespace ShareMonitor;

namespace {

bool expectEq(const std::string& actual, const std::string& expected, const char* what) {
    if (actual == expected) return true;
    std::cerr << what << ": expected '" << expected << "' got '" << actual << "'\n";
    return false;
}

}

int main() {
    bool ok = true;
    ok &= expectEq(formatPrice(1234.56), "$1,234.56", "thousands");
    ok &= expectEq(formatPrice(0.5), "$0.50", "cents");
    ok &= expectEq(formatPrice(1234567.891), "$1,234,567.89", "millions");
    ok &= expectEq(formatPrice(45.0), "$45.00", "whole");

    ok &= expectEq(formatChangePct(1.234), "+1.23% ↑", "positive pct");
    ok &= expectEq(formatChangePct(-0.5), "-0.50% ↓", "negative pct");
    ok &= expectEq(formatChangePct(0.0), "+0.00% ↑", "zero pct");

    ok &= expectEq(formatChangeAbs(0.45, 1.2), "$+0.45 ↑", "positive abs");
    ok &= expectEq(formatChangeAbs(-0.45, -1.0), "$-0.45 ↓", "negative abs");

    std::string clock = formatClock(std::time(nullptr));
    if (clock.size() != 8 || clock[2] != ':' || clock[5] != ':') {
        std::cerr << "Clock should be HH:MM:SS, got " << clock << "\n";
        ok = false;
    }

    std::string name = exportFileName("BHP.AX", std::time(nullptr));
    if (name.rfind("BHP.AX_", 0) != 0 || name.size() != std::string("BHP.AX_20260101_120000.png").size()
        || name.substr(name.size() - 4) != ".png" || name[15] != '_') {
        std::cerr << "Unexpected export name " << name << "\n";
        ok = false;
    }
    std::string combined = exportFileName("", std::time(nullptr));
    if (combined.rfind("MainMonitor_", 0) != 0) {
        std::cerr << "Combined chart export should start with MainMonitor_, got " << combined << "\n";
        ok = false;
    }

    if (!ok) return 1;
    std::cout << "format_test passed\n";
    return 0;
}
