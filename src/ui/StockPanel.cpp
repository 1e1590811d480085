#include "ui/StockPanel.hpp"
#include "ui/PriceChart.hpp"
#include "utils/Format.hpp"
#include <spdlog/spdlog.h>

namespace ShareMonitor {

namespace {

const char* kStateClasses[] = {"stock-up", "stock-down", "stock-error", "stock-muted"};

GtkWidget* makeLabel(const char* text, const char* cssClass) {
    GtkWidget* label = gtk_label_new(text);
    gtk_widget_set_halign(label, GTK_ALIGN_START);
    gtk_widget_add_css_class(label, cssClass);
    return label;
}

}

StockPanel::StockPanel(const std::string& symbol)
    : symbol_(symbol), widget_(nullptr), priceLabel_(nullptr), dailyPctLabel_(nullptr),
      dailyAbsLabel_(nullptr), hourlyPctLabel_(nullptr), hourlyAbsLabel_(nullptr), openLabel_(nullptr) {
    setupUI();
}

StockPanel::~StockPanel() = default;

void StockPanel::setupUI() {
    widget_ = gtk_box_new(GTK_ORIENTATION_VERTICAL, 8);
    gtk_widget_set_margin_start(widget_, 12);
    gtk_widget_set_margin_end(widget_, 12);
    gtk_widget_set_margin_top(widget_, 10);
    gtk_widget_set_margin_bottom(widget_, 10);

    GtkWidget* info = gtk_box_new(GTK_ORIENTATION_VERTICAL, 2);
    gtk_widget_add_css_class(info, "panel-card");

    priceLabel_ = makeLabel("Current Price: N/A", "stock-price");
    dailyPctLabel_ = makeLabel("Daily Change %: N/A", "stock-change");
    dailyAbsLabel_ = makeLabel("Daily Change $: N/A", "stock-change");
    hourlyPctLabel_ = makeLabel("Hourly Change %: N/A", "stock-change");
    hourlyAbsLabel_ = makeLabel("Hourly Change $: N/A", "stock-change");
    openLabel_ = makeLabel("Open Price: N/A", "stock-open");
    gtk_widget_set_halign(openLabel_, GTK_ALIGN_END);

    gtk_box_append(GTK_BOX(info), priceLabel_);
    gtk_box_append(GTK_BOX(info), dailyPctLabel_);
    gtk_box_append(GTK_BOX(info), dailyAbsLabel_);
    gtk_box_append(GTK_BOX(info), hourlyPctLabel_);
    gtk_box_append(GTK_BOX(info), hourlyAbsLabel_);
    gtk_box_append(GTK_BOX(info), openLabel_);
    gtk_box_append(GTK_BOX(widget_), info);

    chart_ = std::make_unique<PriceChart>(symbol_);
    gtk_box_append(GTK_BOX(widget_), chart_->getWidget());
}

void StockPanel::setLabel(GtkWidget* label, const std::string& text, const char* cssClass) {
    gtk_label_set_text(GTK_LABEL(label), text.c_str());
    for (const char* c : kStateClasses) gtk_widget_remove_css_class(label, c);
    gtk_widget_add_css_class(label, cssClass);
}

void StockPanel::showError() {
    setLabel(priceLabel_, "Current Price: N/A", "stock-error");
    setLabel(dailyPctLabel_, "Daily Change %: DATA ERROR", "stock-error");
    setLabel(dailyAbsLabel_, "Daily Change $: N/A", "stock-muted");
    setLabel(hourlyPctLabel_, "Hourly Change %: N/A", "stock-muted");
    setLabel(hourlyAbsLabel_, "Hourly Change $: N/A", "stock-muted");
    setLabel(openLabel_, "Open Price: N/A", "stock-muted");
    chart_->showMessage("DATA ERROR");
}

void StockPanel::update(const QuoteSnapshot* snapshot, const std::string& timezone) {
    if (!snapshot) return;
    if (snapshot->error) {
        showError();
        return;
    }

    const DerivedMetrics& m = snapshot->metrics;
    const char* daily = m.dailyChangePct >= 0 ? "stock-up" : "stock-down";
    const char* hourly = m.hourlyChangePct >= 0 ? "stock-up" : "stock-down";

    setLabel(priceLabel_, "Current Price: " + formatPrice(m.price), daily);
    setLabel(dailyPctLabel_, "Daily Change %: " + formatChangePct(m.dailyChangePct), daily);
    setLabel(dailyAbsLabel_, "Daily Change $: " + formatChangeAbs(m.dailyChangeAbs, m.dailyChangePct), daily);
    setLabel(hourlyPctLabel_, "Hourly Change %: " + formatChangePct(m.hourlyChangePct), hourly);
    setLabel(hourlyAbsLabel_, "Hourly Change $: " + formatChangeAbs(m.hourlyChangeAbs, m.hourlyChangePct), hourly);
    setLabel(openLabel_, "Open Price: " + formatPrice(m.openPrice), "stock-muted");

    const char* rangeLabel = timeRangeSpec(snapshot->range).label;
    if (snapshot->history.empty()) {
        chart_->showMessage("NO HISTORICAL DATA");
    } else {
        ChartData data;
        data.series.push_back(ChartSeries{symbol_, m.dailyChangePct >= 0 ? gainColor() : lossColor(),
                                          snapshot->history.points});
        data.metrics.push_back(m);
        data.title = std::string(rangeLabel) + " Closing Price";
        data.priceLabel = "Price";
        data.range = snapshot->range;
        data.timezone = timezone;
        chart_->setData(std::move(data));
    }
    spdlog::debug("PLOT: {} plot updated ({})", symbol_, rangeLabel);
}

}
