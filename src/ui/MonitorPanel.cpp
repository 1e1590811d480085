#include "ui/MonitorPanel.hpp"
#include "app/RefreshCoordinator.hpp"
#include "ui/PriceChart.hpp"
#include "utils/Format.hpp"
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace ShareMonitor {

namespace {

const char* kCheckMark = "✔";
const char* kCrossMark = "✘";

GtkWidget* makeCell(const std::string& text, const char* cssClass, bool alignEnd) {
    GtkWidget* label = gtk_label_new(text.c_str());
    gtk_widget_set_halign(label, alignEnd ? GTK_ALIGN_END : GTK_ALIGN_START);
    gtk_widget_add_css_class(label, "monitor-cell");
    if (cssClass) gtk_widget_add_css_class(label, cssClass);
    return label;
}

}

MonitorPanel::MonitorPanel(RefreshCoordinator& coordinator)
    : coordinator_(coordinator), widget_(nullptr), table_(nullptr) {
    setupUI();
}

MonitorPanel::~MonitorPanel() = default;

void MonitorPanel::setupUI() {
    widget_ = gtk_box_new(GTK_ORIENTATION_VERTICAL, 8);
    gtk_widget_set_margin_start(widget_, 10);
    gtk_widget_set_margin_end(widget_, 10);
    gtk_widget_set_margin_top(widget_, 10);
    gtk_widget_set_margin_bottom(widget_, 10);

    GtkWidget* scroll = gtk_scrolled_window_new();
    gtk_scrolled_window_set_policy(GTK_SCROLLED_WINDOW(scroll), GTK_POLICY_AUTOMATIC, GTK_POLICY_AUTOMATIC);
    gtk_scrolled_window_set_min_content_height(GTK_SCROLLED_WINDOW(scroll), 140);
    gtk_scrolled_window_set_max_content_height(GTK_SCROLLED_WINDOW(scroll), 220);
    gtk_scrolled_window_set_propagate_natural_height(GTK_SCROLLED_WINDOW(scroll), TRUE);

    table_ = gtk_grid_new();
    gtk_grid_set_column_spacing(GTK_GRID(table_), 18);
    gtk_grid_set_row_spacing(GTK_GRID(table_), 2);
    gtk_widget_add_css_class(table_, "monitor-table");
    gtk_scrolled_window_set_child(GTK_SCROLLED_WINDOW(scroll), table_);
    gtk_box_append(GTK_BOX(widget_), scroll);

    chart_ = std::make_unique<PriceChart>("");
    gtk_box_append(GTK_BOX(widget_), chart_->getWidget());
    chart_->showMessage("ADD STOCKS TO VIEW COMBINED CHART");
}

void MonitorPanel::update(const AppState& state) {
    rebuildTable(state);
    updateChart(state);
}

void MonitorPanel::rebuildTable(const AppState& state) {
    GtkWidget* child;
    while ((child = gtk_widget_get_first_child(table_)) != nullptr)
        gtk_grid_remove(GTK_GRID(table_), child);

    const auto& columns = monitorColumns();
    for (size_t c = 0; c < columns.size(); ++c) {
        std::string title = columnTitle(columns[c]);
        if (columns[c] == state.sort.column()) title += state.sort.descending() ? " ▼" : " ▲";

        GtkWidget* header = gtk_button_new_with_label(title.c_str());
        gtk_widget_add_css_class(header, "monitor-header");
        g_object_set_data(G_OBJECT(header), "column", GINT_TO_POINTER(static_cast<int>(columns[c])));
        g_signal_connect(header, "clicked", G_CALLBACK(onHeaderClicked), this);
        gtk_grid_attach(GTK_GRID(table_), header, static_cast<int>(c), 0, 1, 1);
    }

    int rowIndex = 1;
    for (const auto& row : state.monitorRows()) {
        const char* rowClass = row.error ? "stock-error" : (row.metrics.isGain() ? "stock-up" : "stock-down");

        GtkWidget* toggle = gtk_button_new_with_label(row.visible ? kCheckMark : kCrossMark);
        gtk_widget_add_css_class(toggle, "visibility-toggle");
        gtk_widget_set_tooltip_text(toggle, "Show or hide on the combined chart");
        g_object_set_data_full(G_OBJECT(toggle), "symbol", g_strdup(row.symbol.c_str()), g_free);
        g_signal_connect(toggle, "clicked", G_CALLBACK(onVisibilityClicked), this);
        gtk_grid_attach(GTK_GRID(table_), toggle, 0, rowIndex, 1, 1);

        gtk_grid_attach(GTK_GRID(table_), makeCell(row.symbol, rowClass, false), 1, rowIndex, 1, 1);

        std::vector<std::string> values;
        if (row.error) {
            values.assign(6, kNotAvailable);
        } else {
            const DerivedMetrics& m = row.metrics;
            values = {
                formatPrice(m.price),
                formatPrice(m.openPrice),
                formatChangePct(m.dailyChangePct),
                formatChangeAbs(m.dailyChangeAbs, m.dailyChangePct),
                formatChangePct(m.hourlyChangePct),
                formatChangeAbs(m.hourlyChangeAbs, m.hourlyChangePct)
            };
        }
        for (size_t i = 0; i < values.size(); ++i) {
            gtk_grid_attach(GTK_GRID(table_), makeCell(values[i], rowClass, true),
                            static_cast<int>(i) + 2, rowIndex, 1, 1);
        }
        ++rowIndex;
    }
}

void MonitorPanel::updateChart(const AppState& state) {
    ChartData data;
    size_t index = 0;
    for (const auto& entry : state.snapshots) {
        const QuoteSnapshot& snap = entry.second;
        const size_t colorIndex = index++;
        if (!state.isVisible(entry.first) || snap.error || snap.history.empty()) continue;
        data.series.push_back(ChartSeries{entry.first, seriesColor(colorIndex), snap.history.points});
        data.metrics.push_back(snap.metrics);
    }

    if (data.series.empty()) {
        chart_->showMessage("ADD STOCKS TO VIEW COMBINED CHART");
        return;
    }

    // The series still belong to the previous range until the next batch lands
    const TimeRange range = state.displayedRange();
    const char* rangeLabel = timeRangeSpec(range).label;
    data.title = std::string("Closing Price Chart (") + rangeLabel + ")";
    data.priceLabel = "Price (AUD)";
    data.range = range;
    data.timezone = state.settings.timezone;
    data.legend = true;
    spdlog::debug("PLOT: Main Monitor plot updated with {} series", data.series.size());
    chart_->setData(std::move(data));
}

void MonitorPanel::onHeaderClicked(GtkButton* button, gpointer userData) {
    auto* self = static_cast<MonitorPanel*>(userData);
    auto column = static_cast<SortColumn>(GPOINTER_TO_INT(g_object_get_data(G_OBJECT(button), "column")));
    self->coordinator_.sortBy(column);
}

void MonitorPanel::onVisibilityClicked(GtkButton* button, gpointer userData) {
    auto* self = static_cast<MonitorPanel*>(userData);
    const char* sym = static_cast<const char*>(g_object_get_data(G_OBJECT(button), "symbol"));
    if (sym) {
        spdlog::info("CHART: Toggled visibility for {}", sym);
        self->coordinator_.toggleVisibility(sym);
    }
}

}
