#pragma once
#include <istream>
#include <string>
#include <vector>
#include "services/MarketData.hpp"

namespace ShareMonitor {

struct Settings {
    TimeRange timeRange = kDefaultTimeRange;
    std::string timezone = defaultTimezone();

    bool operator==(const Settings& other) const {
        return timeRange == other.timeRange && timezone == other.timezone;
    }
    bool operator!=(const Settings& other) const { return !(*this == other); }
};

// Plain-text persistence for the tracked symbols and the user settings.
// Read failures fall back to defaults; write failures are logged and reported
// through the return value.
class Config {
public:
    // Empty directory selects defaultConfigDir()
    explicit Config(std::string configDir = "");

    // $XDG_CONFIG_HOME/sharemonitor, usually ~/.config/sharemonitor
    static std::string defaultConfigDir();

    std::vector<std::string> loadStockSymbols() const;
    bool saveStockSymbols(const std::vector<std::string>& symbols) const;

    Settings loadSettings() const;
    bool saveSettings(const Settings& settings) const;

    const std::string& configDir() const { return configDir_; }
    std::string stocksPath() const;
    std::string settingsPath() const;

    static std::vector<std::string> defaultStockSymbols();
    static std::vector<std::string> parseStockSymbols(std::istream& in);
    static Settings parseSettings(std::istream& in);

private:
    bool ensureConfigDir() const;

    std::string configDir_;
};

}
