#pragma once
#include <gtk/gtk.h>
#include <string>
#include <vector>
#include "ui/ChartModel.hpp"

namespace ShareMonitor {

// Everything a chart draws. metrics is parallel to series and feeds the
// hover tooltip.
struct ChartData {
    std::vector<ChartSeries> series;
    std::vector<DerivedMetrics> metrics;
    std::string title;
    std::string priceLabel;
    TimeRange range = kDefaultTimeRange;
    std::string timezone;
    bool legend = false;
};

// Line chart on a GtkDrawingArea with a nearest-point hover tooltip and a
// "Save PNG" button. exportName is the symbol, or empty for the combined chart.
class PriceChart {
public:
    explicit PriceChart(std::string exportName);
    ~PriceChart();

    PriceChart(const PriceChart&) = delete;
    PriceChart& operator=(const PriceChart&) = delete;

    GtkWidget* getWidget() const { return widget_; }

    void setData(ChartData data);
    // Replaces the plot with a centred red message
    void showMessage(const std::string& text);

    bool exportPng(const std::string& path) const;
    std::string suggestedFileName() const;

private:
    void render(cairo_t* cr, int width, int height) const;
    void drawTooltip(cairo_t* cr, const ChartLayout& layout, int width, int height) const;
    PlotArea plotArea(int width, int height) const;

    static void onDraw(GtkDrawingArea* area, cairo_t* cr, int width, int height, gpointer userData);
    static void onMotion(GtkEventControllerMotion* controller, double x, double y, gpointer userData);
    static void onLeave(GtkEventControllerMotion* controller, gpointer userData);
    static void onSaveClicked(GtkButton* button, gpointer userData);
    static void onSaveResponse(GObject* source, GAsyncResult* result, gpointer userData);

    std::string exportName_;
    GtkWidget* widget_;
    GtkWidget* area_;
    GtkEventController* motion_;
    ChartData data_;
    std::string message_;
    HoverState hover_;
};

}
