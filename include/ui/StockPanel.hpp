#pragma once
#include <gtk/gtk.h>
#include <memory>
#include <string>
#include "services/StockService.hpp"

namespace ShareMonitor {

class PriceChart;

// Detail page for one symbol: price, change labels, open price and a
// history chart
class StockPanel {
public:
    explicit StockPanel(const std::string& symbol);
    ~StockPanel();

    GtkWidget* getWidget() const { return widget_; }
    const std::string& symbol() const { return symbol_; }

    // nullptr before the first fetch for this symbol has completed
    void update(const QuoteSnapshot* snapshot, const std::string& timezone);

private:
    void setupUI();
    void showError();
    static void setLabel(GtkWidget* label, const std::string& text, const char* cssClass);

    std::string symbol_;
    GtkWidget* widget_;
    GtkWidget* priceLabel_;
    GtkWidget* dailyPctLabel_;
    GtkWidget* dailyAbsLabel_;
    GtkWidget* hourlyPctLabel_;
    GtkWidget* hourlyAbsLabel_;
    GtkWidget* openLabel_;
    std::unique_ptr<PriceChart> chart_;
};

}
