#include "utils/Config.hpp"
#include <glib.h>
#include <spdlog/spdlog.h>
#include <fstream>
#include <utility>

namespace ShareMonitor {

namespace {

const char* kStocksFile = "my_stocks.txt";
const char* kSettingsFile = "settings.txt";

std::string trimLine(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

}

Config::Config(std::string configDir) : configDir_(std::move(configDir)) {
    if (configDir_.empty()) configDir_ = defaultConfigDir();
}

std::string Config::defaultConfigDir() {
    return std::string(g_get_user_config_dir()) + "/sharemonitor";
}

std::string Config::stocksPath() const {
    return configDir_ + "/" + kStocksFile;
}

std::string Config::settingsPath() const {
    return configDir_ + "/" + kSettingsFile;
}

bool Config::ensureConfigDir() const {
    if (g_mkdir_with_parents(configDir_.c_str(), 0755) != 0) {
        spdlog::error("CONFIG: cannot create {}", configDir_);
        return false;
    }
    return true;
}

std::vector<std::string> Config::defaultStockSymbols() {
    return {"BHP.AX", "PL8.AX"};
}

std::vector<std::string> Config::parseStockSymbols(std::istream& in) {
    std::vector<std::string> symbols;
    std::string line;
    while (std::getline(in, line)) {
        symbols.push_back(line);
    }
    return canonicalSymbolSet(symbols);
}

Settings Config::parseSettings(std::istream& in) {
    Settings settings;
    std::string line;
    while (std::getline(in, line)) {
        size_t eq = line.find('=');
        if (eq == std::string::npos) continue;
        std::string key = trimLine(line.substr(0, eq));
        std::string value = trimLine(line.substr(eq + 1));

        if (key == "time_range") {
            if (auto range = timeRangeFromLabel(value)) settings.timeRange = *range;
        } else if (key == "timezone") {
            if (isSupportedTimezone(value)) settings.timezone = value;
        }
    }
    return settings;
}

std::vector<std::string> Config::loadStockSymbols() const {
    std::ifstream in(stocksPath());
    if (!in) {
        spdlog::info("CONFIG: no symbol list at {}, using defaults", stocksPath());
        return defaultStockSymbols();
    }
    return parseStockSymbols(in);
}

bool Config::saveStockSymbols(const std::vector<std::string>& symbols) const {
    if (!ensureConfigDir()) return false;

    std::ofstream out(stocksPath(), std::ios::trunc);
    if (!out) {
        spdlog::error("CONFIG: cannot write {}", stocksPath());
        return false;
    }
    auto unique = canonicalSymbolSet(symbols);
    for (size_t i = 0; i < unique.size(); ++i) {
        if (i > 0) out << '\n';
        out << unique[i];
    }
    out.flush();
    return static_cast<bool>(out);
}

Settings Config::loadSettings() const {
    std::ifstream in(settingsPath());
    if (!in) return Settings{};
    return parseSettings(in);
}

bool Config::saveSettings(const Settings& settings) const {
    if (!ensureConfigDir()) return false;

    std::ofstream out(settingsPath(), std::ios::trunc);
    if (!out) {
        spdlog::error("CONFIG: cannot write {}", settingsPath());
        return false;
    }
    out << "time_range=" << timeRangeSpec(settings.timeRange).label << "\n";
    out << "timezone=" << settings.timezone << "\n";
    out.flush();
    return static_cast<bool>(out);
}

}
