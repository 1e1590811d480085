#include "utils/Logging.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <map>
#include <memory>
#include <vector>

namespace ShareMonitor {

std::optional<spdlog::level::level_enum> parseLogLevel(const std::string& name) {
    static const std::map<std::string, spdlog::level::level_enum> levels{
        {"trace", spdlog::level::trace},
        {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},
        {"warn", spdlog::level::warn},
        {"error", spdlog::level::err},
        {"off", spdlog::level::off}};
    auto it = levels.find(name);
    if (it == levels.end()) return std::nullopt;
    return it->second;
}

void initLogging(spdlog::level::level_enum level, const std::string& logFile) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (!logFile.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile, true));
        } catch (const spdlog::spdlog_ex& e) {
            // Console logging still works without the file
            spdlog::warn("LOG: cannot open log file {}: {}", logFile, e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>("sharemonitor", sinks.begin(), sinks.end());
    logger->set_pattern("[%H:%M:%S] [%l] %v");
    logger->set_level(level);
    spdlog::set_default_logger(logger);
}

}
