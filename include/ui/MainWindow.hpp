#pragma once

#include <gtk/gtk.h>
#include <map>
#include <memory>
#include <string>

namespace ShareMonitor {

class MonitorPanel;
class StockPanel;
class RefreshCoordinator;
struct StatusMessage;

class MainWindow {
public:
    MainWindow(GtkApplication* app, RefreshCoordinator& coordinator);
    ~MainWindow();

    void show();
    GtkWidget* getWidget() const { return window_; }

    void setStatus(const StatusMessage& status);
    void setFetching(bool fetching);

    // Redraws from the coordinator state; pages follow the tracked symbols
    void refreshState();
    // Also re-renders every detail page from the latest snapshots
    void refreshData();

    // Tab switches start fetching once the startup sequence has finished
    void enableTabFetch() { tabFetchEnabled_ = true; }

private:
    void setupUI();
    void setupControls(GtkWidget* parent);
    void setupNotebook(GtkWidget* parent);
    void applyCSS();
    void syncPages();
    void syncRangeSelector();
    std::string currentPageSymbol() const;

    static void onAddClicked(GtkButton* button, gpointer userData);
    static void onEntryActivate(GtkEntry* entry, gpointer userData);
    static void onRemoveClicked(GtkButton* button, gpointer userData);
    static void onRefreshClicked(GtkButton* button, gpointer userData);
    static void onSettingsClicked(GtkButton* button, gpointer userData);
    static void onRangeChanged(GObject* dropDown, GParamSpec* pspec, gpointer userData);
    static void onSwitchPage(GtkNotebook* notebook, GtkWidget* page, guint pageNum, gpointer userData);

    RefreshCoordinator& coordinator_;
    GtkWidget* window_;
    GtkWidget* symbolEntry_;
    GtkWidget* refreshButton_;
    GtkWidget* rangeCombo_;
    GtkWidget* notebook_;
    GtkWidget* statusLabel_;
    GtkCssProvider* cssProvider_;

    std::unique_ptr<MonitorPanel> monitorPanel_;
    std::map<std::string, std::unique_ptr<StockPanel>> stockPanels_;
    bool tabFetchEnabled_ = false;
    bool syncingRange_ = false;
};

}
