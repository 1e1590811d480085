#include "app/StartupSequence.hpp"
#include <algorithm>

namespace ShareMonitor {

namespace {

std::chrono::milliseconds remaining(StartupPacing::Clock::time_point since,
                                    std::chrono::milliseconds minimum,
                                    StartupPacing::Clock::time_point now) {
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - since);
    return std::max(std::chrono::milliseconds(0), minimum - elapsed);
}

}

const std::vector<StartupStep>& startupSteps() {
    static const std::vector<StartupStep> steps = {
        {0, "Starting up..."},
        {20, "Fetching Shares..."},
        {50, "Fetching Data..."},
        {80, "Asking Jordan Belfort for help..."},
        {100, "Load Complete"}
    };
    return steps;
}

const StartupStep& startupStep(int progress) {
    const auto& steps = startupSteps();
    for (const auto& step : steps) {
        if (step.progress >= progress) return step;
    }
    return steps.back();
}

StartupPacing::StartupPacing(Clock::time_point start)
    : start_(start), fetchStart_(start) {}

void StartupPacing::fetchStarted(Clock::time_point when) {
    fetchStart_ = when;
}

std::chrono::milliseconds StartupPacing::fetchGateRemaining(Clock::time_point now) const {
    return remaining(fetchStart_, kMinFetchDuration, now);
}

std::chrono::milliseconds StartupPacing::totalGateRemaining(Clock::time_point now) const {
    return remaining(start_, kMinSplashDuration, now);
}

}
