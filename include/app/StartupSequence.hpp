#pragma once
#include <chrono>
#include <string>
#include <vector>

namespace ShareMonitor {

struct StartupStep {
    int progress;
    std::string message;
};

// Splash progress steps, in order: 0, 20, 50, 80, 100
const std::vector<StartupStep>& startupSteps();
const StartupStep& startupStep(int progress);

constexpr std::chrono::milliseconds kMinFetchDuration{1000};
constexpr std::chrono::milliseconds kMinSplashDuration{7000};

// Minimum-duration gates for the splash screen. The caller supplies the
// current time so the arithmetic can be checked without sleeping.
class StartupPacing {
public:
    using Clock = std::chrono::steady_clock;

    explicit StartupPacing(Clock::time_point start = Clock::now());

    void fetchStarted(Clock::time_point when = Clock::now());

    // Time still to wait before leaving the "fetching" step
    std::chrono::milliseconds fetchGateRemaining(Clock::time_point now = Clock::now()) const;
    // Time still to wait before the splash may close
    std::chrono::milliseconds totalGateRemaining(Clock::time_point now = Clock::now()) const;

private:
    Clock::time_point start_;
    Clock::time_point fetchStart_;
};

}
