#include "app/Application.hpp"
#include "utils/HttpClient.hpp"
#include <spdlog/spdlog.h>

int main(int argc, char* argv[]) {
    try {
        ShareMonitor::HttpClient::globalInit();
        ShareMonitor::Application app;
        return app.run(argc, argv);
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
