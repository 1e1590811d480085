#include "app/Application.hpp"
#include "app/RefreshCoordinator.hpp"
#include "app/StartupSequence.hpp"
#include "services/StockService.hpp"
#include "services/YahooFinanceProvider.hpp"
#include "ui/MainWindow.hpp"
#include "ui/SplashWindow.hpp"
#include "utils/Config.hpp"
#include "utils/Dispatcher.hpp"
#include "utils/Logging.hpp"
#include <spdlog/spdlog.h>
#include <chrono>

namespace ShareMonitor {

Application::Application() : app_(nullptr) {
    app_ = gtk_application_new("com.sharemonitor.app", G_APPLICATION_DEFAULT_FLAGS);

    g_application_add_main_option(G_APPLICATION(app_), "config-dir", 0, G_OPTION_FLAG_NONE,
                                  G_OPTION_ARG_FILENAME, "Directory holding my_stocks.txt and settings.txt", "DIR");
    g_application_add_main_option(G_APPLICATION(app_), "log-level", 0, G_OPTION_FLAG_NONE,
                                  G_OPTION_ARG_STRING, "trace, debug, info, warn, error or off", "LEVEL");
    g_application_add_main_option(G_APPLICATION(app_), "log-file", 0, G_OPTION_FLAG_NONE,
                                  G_OPTION_ARG_FILENAME, "Also write the log to this file", "PATH");

    g_signal_connect(app_, "handle-local-options", G_CALLBACK(onHandleLocalOptions), this);
    g_signal_connect(app_, "activate", G_CALLBACK(onActivate), this);
    g_signal_connect(app_, "shutdown", G_CALLBACK(onShutdown), this);
}

Application::~Application() {
    mainWindow_.reset();
    splash_.reset();
    coordinator_.reset();
    if (app_) {
        g_object_unref(app_);
    }
}

int Application::run(int argc, char* argv[]) {
    return g_application_run(G_APPLICATION(app_), argc, argv);
}

gint Application::onHandleLocalOptions(GApplication*, GVariantDict* options, gpointer userData) {
    auto* self = static_cast<Application*>(userData);

    auto level = spdlog::level::info;
    const char* levelName = nullptr;
    bool badLevel = false;
    if (g_variant_dict_lookup(options, "log-level", "&s", &levelName)) {
        if (auto parsed = parseLogLevel(levelName)) level = *parsed;
        else badLevel = true;
    }

    std::string logFile;
    const char* logPath = nullptr;
    if (g_variant_dict_lookup(options, "log-file", "^&ay", &logPath)) logFile = logPath;
    initLogging(level, logFile);
    if (badLevel) spdlog::warn("Unknown log level '{}', using info", levelName);

    const char* dir = nullptr;
    if (g_variant_dict_lookup(options, "config-dir", "^&ay", &dir)) self->configDir_ = dir;

    // -1 lets GApplication continue with the default handling
    return -1;
}

void Application::onActivate(GtkApplication* app, gpointer userData) {
    auto* self = static_cast<Application*>(userData);
    if (self->started_) {
        self->mainWindow_->show();
        return;
    }
    if (self->coordinator_) return;

    spdlog::info("STARTUP: Starting initial load sequence");
    self->config_ = std::make_unique<Config>(self->configDir_);
    self->dispatcher_ = std::make_shared<GlibDispatcher>();
    auto provider = std::make_shared<YahooFinanceProvider>();
    auto service = std::make_shared<StockService>(provider);
    self->coordinator_ = std::make_unique<RefreshCoordinator>(*self->config_, service, self->dispatcher_);
    self->coordinator_->load();

    self->pacing_ = std::make_unique<StartupPacing>();
    self->splash_ = std::make_unique<SplashWindow>(app, SplashWindow::findLogo());
    self->splash_->show();

    self->mainWindow_ = std::make_unique<MainWindow>(app, *self->coordinator_);
    self->wireCoordinator();

    self->splash_->setStep(20);
    self->dispatcher_->post([self]() { self->beginInitialFetch(); });
}

void Application::wireCoordinator() {
    coordinator_->setStatusCallback([this](const StatusMessage& status) {
        mainWindow_->setStatus(status);
        mainWindow_->setFetching(coordinator_->isFetching());
    });
    coordinator_->setStateCallback([this]() {
        mainWindow_->refreshState();
    });
    coordinator_->setUpdateCallback([this](const SnapshotBatch&) {
        mainWindow_->refreshData();
    });
    coordinator_->setFetchFinishedCallback([this](bool) {
        mainWindow_->setFetching(coordinator_->isFetching());
        if (initialFetchPending_) initialFetchDone();
    });
}

void Application::beginInitialFetch() {
    splash_->setStep(50);
    pacing_->fetchStarted();
    initialFetchPending_ = true;
    coordinator_->requestFetch(FetchReason::Startup);
    // Nothing was queued (no symbols), so no completion will arrive
    if (initialFetchPending_ && !coordinator_->isFetching()) initialFetchDone();
}

void Application::initialFetchDone() {
    initialFetchPending_ = false;
    spdlog::info("LOADING: Initial data processed");

    auto fetchWait = pacing_->fetchGateRemaining();
    if (fetchWait.count() > 0) {
        spdlog::info("LOADING: Enforcing {}ms minimum fetch time", fetchWait.count());
    }
    dispatcher_->scheduleOnce(fetchWait, [this]() {
        splash_->setStep(80);
        auto totalWait = pacing_->totalGateRemaining();
        if (totalWait.count() > 0) {
            spdlog::info("LOADING: Enforcing {}ms total minimum duration", totalWait.count());
        }
        dispatcher_->scheduleOnce(totalWait, [this]() {
            splash_->setStep(100);
            dispatcher_->scheduleOnce(std::chrono::milliseconds(100), [this]() { finishStartup(); });
        });
    });
}

void Application::finishStartup() {
    started_ = true;
    mainWindow_->refreshData();
    mainWindow_->show();
    splash_->close();
    mainWindow_->enableTabFetch();
    coordinator_->startAutoRefresh();
    spdlog::info("STARTUP: Main window shown");
}

void Application::onShutdown(GtkApplication*, gpointer userData) {
    auto* self = static_cast<Application*>(userData);
    spdlog::info("SHUTDOWN: Application closed by user");
    if (self->coordinator_) self->coordinator_->shutdown();
    self->mainWindow_.reset();
    self->splash_.reset();
}

}
