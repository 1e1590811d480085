#pragma once
#include <gtk/gtk.h>
#include <memory>
#include "app/AppState.hpp"

namespace ShareMonitor {

class PriceChart;
class RefreshCoordinator;

// "Main Monitor" page: sortable summary table of every tracked symbol plus
// the combined chart of the rows marked visible
class MonitorPanel {
public:
    explicit MonitorPanel(RefreshCoordinator& coordinator);
    ~MonitorPanel();

    GtkWidget* getWidget() const { return widget_; }

    void update(const AppState& state);

private:
    void setupUI();
    void rebuildTable(const AppState& state);
    void updateChart(const AppState& state);

    static void onHeaderClicked(GtkButton* button, gpointer userData);
    static void onVisibilityClicked(GtkButton* button, gpointer userData);

    RefreshCoordinator& coordinator_;
    GtkWidget* widget_;
    GtkWidget* table_;
    std::unique_ptr<PriceChart> chart_;
};

}
