#pragma once

#include <gtk/gtk.h>
#include <memory>
#include <string>

namespace ShareMonitor {

class Config;
class Dispatcher;
class MainWindow;
class RefreshCoordinator;
class SplashWindow;
class StartupPacing;

class Application {
public:
    Application();
    ~Application();

    int run(int argc, char* argv[]);

    GtkApplication* getGtkApp() const { return app_; }

private:
    static gint onHandleLocalOptions(GApplication* app, GVariantDict* options, gpointer userData);
    static void onActivate(GtkApplication* app, gpointer userData);
    static void onShutdown(GtkApplication* app, gpointer userData);

    void wireCoordinator();
    void beginInitialFetch();
    void initialFetchDone();
    void finishStartup();

    GtkApplication* app_;
    std::string configDir_;

    std::unique_ptr<Config> config_;
    std::shared_ptr<Dispatcher> dispatcher_;
    std::unique_ptr<RefreshCoordinator> coordinator_;
    std::unique_ptr<SplashWindow> splash_;
    std::unique_ptr<MainWindow> mainWindow_;
    std::unique_ptr<StartupPacing> pacing_;
    bool initialFetchPending_ = false;
    bool started_ = false;
};

}
