#include <chrono>
#include <iostream>
#include "app/StartupSequence.hpp"

using namespace ShareMonitor;
using namespace std::chrono_literals;

int main() {
    const auto& steps = startupSteps();
    if (steps.size() != 5 || steps.front().progress != 0 || steps.back().progress != 100) {
        std::cerr << "Unexpected step table\n";
        return 1;
    }
    if (startupStep(80).message != "Asking Jordan Belfort for help..." ||
        startupStep(20).message != "Fetching Shares..." ||
        startupStep(100).message != "Load Complete") {
        std::cerr << "Step messages wrong\n";
        return 1;
    }

    auto t0 = StartupPacing::Clock::time_point{} + 1h;
    StartupPacing pacing(t0);
    pacing.fetchStarted(t0 + 2s);

    if (pacing.fetchGateRemaining(t0 + 2500ms) != 500ms) {
        std::cerr << "Fetch gate should hold for the rest of one second\n";
        return 1;
    }
    if (pacing.totalGateRemaining(t0 + 2500ms) != 4500ms) {
        std::cerr << "Splash gate should hold for the rest of seven seconds\n";
        return 1;
    }
    if (pacing.fetchGateRemaining(t0 + 8s) != 0ms || pacing.totalGateRemaining(t0 + 8s) != 0ms) {
        std::cerr << "Gates should not go negative\n";
        return 1;
    }

    std::cout << "startup_sequence_test passed\n";
    return 0;
}
