#include <glib.h>
#include <glib/gstdio.h>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include "services/MarketData.hpp"
#include "utils/Config.hpp"

using namespace ShareMonitor;

namespace {

std::string readFile(const std::string& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

std::string joined(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& s : items) {
        if (!out.empty()) out += ",";
        out += s;
    }
    return out;
}

}

int main() {
    {
        struct Case { const char* raw; const char* expected; };
        const Case cases[] = {
            {"bhp", "BHP.AX"},
            {"  pl8.ax ", "PL8.AX"},
            {"BHP.AX", "BHP.AX"},
            {"aapl.us", "AAPL.US"},
            {"   ", ""},
            {"", ""},
        };
        for (const auto& c : cases) {
            std::string got = normalizeSymbol(c.raw);
            if (got != c.expected) {
                std::cerr << "normalizeSymbol('" << c.raw << "') = '" << got << "', expected '" << c.expected << "'\n";
                return 1;
            }
        }
    }

    {
        std::istringstream in("bhp.ax\nBHP.AX\n\n  pl8.ax  \r\n");
        auto symbols = Config::parseStockSymbols(in);
        if (joined(symbols) != "BHP.AX,PL8.AX") {
            std::cerr << "Symbol file should be deduplicated and uppercased, got " << joined(symbols) << "\n";
            return 1;
        }
    }

    {
        std::istringstream in("time_range=6 Hrs\ntimezone=Australia/Perth\n");
        Settings s = Config::parseSettings(in);
        if (s.timeRange != TimeRange::SixHours || s.timezone != "Australia/Perth") {
            std::cerr << "Settings not parsed\n";
            return 1;
        }
    }

    {
        // Unknown values and junk lines keep the defaults
        std::istringstream in("garbage\ntime_range=2 Years\ntimezone=Europe/London\n=\n");
        Settings s = Config::parseSettings(in);
        if (s != Settings{} || s.timeRange != TimeRange::ThirtyDays || s.timezone != "Australia/Sydney") {
            std::cerr << "Malformed settings should fall back to defaults\n";
            return 1;
        }
    }

    GError* error = nullptr;
    gchar* tmp = g_dir_make_tmp("sharemonitor-config-XXXXXX", &error);
    if (!tmp) {
        std::cerr << "Cannot create temp dir: " << (error ? error->message : "?") << "\n";
        if (error) g_error_free(error);
        return 1;
    }
    std::string base(tmp);
    std::string dir = base + "/nested";
    g_free(tmp);

    Config config(dir);

    {
        // First run: no files yet
        if (joined(config.loadStockSymbols()) != "BHP.AX,PL8.AX") {
            std::cerr << "Missing symbol file should give the defaults\n";
            return 1;
        }
        if (config.loadSettings() != Settings{}) {
            std::cerr << "Missing settings file should give the defaults\n";
            return 1;
        }
    }

    {
        if (!config.saveStockSymbols({"PL8.AX", "bhp.ax", "BHP.AX", "CBA.AX"})) {
            std::cerr << "saveStockSymbols failed\n";
            return 1;
        }
        std::string contents = readFile(config.stocksPath());
        if (contents != "BHP.AX\nCBA.AX\nPL8.AX") {
            std::cerr << "Unexpected symbol file contents: '" << contents << "'\n";
            return 1;
        }
        if (joined(config.loadStockSymbols()) != "BHP.AX,CBA.AX,PL8.AX") {
            std::cerr << "Symbols did not survive a round trip\n";
            return 1;
        }
    }

    {
        // An empty list is kept as empty, not replaced by the defaults
        if (!config.saveStockSymbols({}) || !config.loadStockSymbols().empty()) {
            std::cerr << "Empty symbol list should persist as empty\n";
            return 1;
        }
    }

    {
        Settings s;
        s.timeRange = TimeRange::TenMinutes;
        s.timezone = "Australia/Brisbane";
        if (!config.saveSettings(s)) {
            std::cerr << "saveSettings failed\n";
            return 1;
        }
        if (readFile(config.settingsPath()) != "time_range=10 Mins\ntimezone=Australia/Brisbane\n") {
            std::cerr << "Unexpected settings file: " << readFile(config.settingsPath()) << "\n";
            return 1;
        }
        if (config.loadSettings() != s) {
            std::cerr << "Settings did not survive a round trip\n";
            return 1;
        }
    }

    g_remove(config.stocksPath().c_str());
    g_remove(config.settingsPath().c_str());
    g_rmdir(dir.c_str());
    g_rmdir(base.c_str());

    std::cout << "config_test passed\n";
    return 0;
}
