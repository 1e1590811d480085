#include "ui/MainWindow.hpp"
#include "app/RefreshCoordinator.hpp"
#include "ui/MonitorPanel.hpp"
#include "ui/SettingsDialog.hpp"
#include "ui/StockPanel.hpp"
#include <spdlog/spdlog.h>
#include <vector>

namespace ShareMonitor {

namespace {

const char* kStatusClasses[] = {"status-info", "status-busy", "status-success", "status-warning", "status-error"};

const char* statusClass(StatusMessage::Level level) {
    switch (level) {
        case StatusMessage::Level::Info: return "status-info";
        case StatusMessage::Level::Busy: return "status-busy";
        case StatusMessage::Level::Success: return "status-success";
        case StatusMessage::Level::Warning: return "status-warning";
        case StatusMessage::Level::Error: return "status-error";
    }
    return "status-info";
}

}

MainWindow::MainWindow(GtkApplication* app, RefreshCoordinator& coordinator)
    : coordinator_(coordinator), window_(nullptr), symbolEntry_(nullptr), refreshButton_(nullptr),
      rangeCombo_(nullptr), notebook_(nullptr), statusLabel_(nullptr), cssProvider_(nullptr) {

    window_ = gtk_application_window_new(app);
    gtk_window_set_title(GTK_WINDOW(window_), "ASX Share Monitor");
    gtk_window_set_default_size(GTK_WINDOW(window_), 800, 650);

    applyCSS();
    setupUI();
}

MainWindow::~MainWindow() {
    if (cssProvider_) {
        gtk_style_context_remove_provider_for_display(gdk_display_get_default(),
                                                      GTK_STYLE_PROVIDER(cssProvider_));
        g_object_unref(cssProvider_);
    }
}

void MainWindow::show() {
    gtk_window_present(GTK_WINDOW(window_));
}

void MainWindow::setupUI() {
    GtkWidget* mainBox = gtk_box_new(GTK_ORIENTATION_VERTICAL, 6);
    gtk_widget_add_css_class(mainBox, "main-container");
    gtk_widget_set_margin_start(mainBox, 10);
    gtk_widget_set_margin_end(mainBox, 10);
    gtk_widget_set_margin_top(mainBox, 10);
    gtk_widget_set_margin_bottom(mainBox, 6);
    gtk_window_set_child(GTK_WINDOW(window_), mainBox);

    setupControls(mainBox);
    setupNotebook(mainBox);

    statusLabel_ = gtk_label_new("Status: Ready | Auto-Refresh: 30s");
    gtk_label_set_xalign(GTK_LABEL(statusLabel_), 0);
    gtk_widget_add_css_class(statusLabel_, "status-line");
    gtk_widget_add_css_class(statusLabel_, "status-info");
    gtk_box_append(GTK_BOX(mainBox), statusLabel_);
}

void MainWindow::setupControls(GtkWidget* parent) {
    GtkWidget* controls = gtk_box_new(GTK_ORIENTATION_HORIZONTAL, 6);

    symbolEntry_ = gtk_entry_new();
    gtk_entry_set_placeholder_text(GTK_ENTRY(symbolEntry_), "e.g. BHP");
    gtk_editable_set_width_chars(GTK_EDITABLE(symbolEntry_), 15);
    g_signal_connect(symbolEntry_, "activate", G_CALLBACK(onEntryActivate), this);
    gtk_box_append(GTK_BOX(controls), symbolEntry_);

    GtkWidget* addBtn = gtk_button_new_with_label("Add ASX Stock");
    g_signal_connect(addBtn, "clicked", G_CALLBACK(onAddClicked), this);
    gtk_box_append(GTK_BOX(controls), addBtn);

    GtkWidget* removeBtn = gtk_button_new_with_label("Remove Tab");
    g_signal_connect(removeBtn, "clicked", G_CALLBACK(onRemoveClicked), this);
    gtk_box_append(GTK_BOX(controls), removeBtn);

    refreshButton_ = gtk_button_new_with_label("Manual Refresh");
    g_signal_connect(refreshButton_, "clicked", G_CALLBACK(onRefreshClicked), this);
    gtk_box_append(GTK_BOX(controls), refreshButton_);

    GtkWidget* rangeLabel = gtk_label_new("Chart Range:");
    gtk_widget_set_margin_start(rangeLabel, 12);
    gtk_box_append(GTK_BOX(controls), rangeLabel);

    GtkStringList* rangeList = gtk_string_list_new(nullptr);
    for (const auto& spec : timeRanges()) gtk_string_list_append(rangeList, spec.label);
    rangeCombo_ = gtk_drop_down_new(nullptr, nullptr);
    gtk_drop_down_set_model(GTK_DROP_DOWN(rangeCombo_), G_LIST_MODEL(rangeList));
    g_object_unref(rangeList);
    gtk_box_append(GTK_BOX(controls), rangeCombo_);
    syncRangeSelector();
    g_signal_connect(rangeCombo_, "notify::selected", G_CALLBACK(onRangeChanged), this);

    GtkWidget* spacer = gtk_box_new(GTK_ORIENTATION_HORIZONTAL, 0);
    gtk_widget_set_hexpand(spacer, TRUE);
    gtk_box_append(GTK_BOX(controls), spacer);

    GtkWidget* settingsBtn = gtk_button_new_with_label("Settings");
    g_signal_connect(settingsBtn, "clicked", G_CALLBACK(onSettingsClicked), this);
    gtk_box_append(GTK_BOX(controls), settingsBtn);

    gtk_box_append(GTK_BOX(parent), controls);
}

void MainWindow::setupNotebook(GtkWidget* parent) {
    notebook_ = gtk_notebook_new();
    gtk_notebook_set_scrollable(GTK_NOTEBOOK(notebook_), TRUE);
    gtk_widget_set_vexpand(notebook_, TRUE);
    gtk_widget_set_hexpand(notebook_, TRUE);

    monitorPanel_ = std::make_unique<MonitorPanel>(coordinator_);
    gtk_notebook_append_page(GTK_NOTEBOOK(notebook_), monitorPanel_->getWidget(),
                             gtk_label_new("Main Monitor"));
    syncPages();

    g_signal_connect(notebook_, "switch-page", G_CALLBACK(onSwitchPage), this);
    gtk_box_append(GTK_BOX(parent), notebook_);
}

void MainWindow::applyCSS() {
    const char* css = R"(
        window {
            background-color: #1e1e1e;
            color: #ffffff;
        }

        .main-container {
            background-color: #1e1e1e;
        }

        .panel-card {
            background-color: #262626;
            border-radius: 8px;
            padding: 8px 12px;
        }

        .stock-price {
            font-size: 16pt;
            font-weight: bold;
        }

        .stock-change {
            font-size: 14pt;
        }

        .stock-open {
            font-size: 12pt;
        }

        .stock-up { color: #4caf50; }
        .stock-down { color: #e53935; }
        .stock-error { color: #fdd835; }
        .stock-muted { color: #9e9e9e; }

        .monitor-header {
            font-weight: bold;
            padding: 2px 6px;
        }

        .monitor-cell {
            font-family: monospace;
        }

        .visibility-toggle {
            min-width: 24px;
            padding: 0 4px;
        }

        .status-line {
            padding: 4px 2px;
        }

        .status-info, .status-success { color: #ffffff; }
        .status-busy { color: #fdd835; }
        .status-warning { color: #ffa726; }
        .status-error { color: #e53935; }

        .splash {
            background-color: #1e1e1e;
        }

        .splash-title {
            font-size: 20pt;
            font-weight: bold;
            color: #ffffff;
        }

        .splash-status {
            font-size: 10pt;
            color: #9e9e9e;
        }
    )";

    cssProvider_ = gtk_css_provider_new();
    gtk_css_provider_load_from_string(cssProvider_, css);
    gtk_style_context_add_provider_for_display(
        gdk_display_get_default(),
        GTK_STYLE_PROVIDER(cssProvider_),
        GTK_STYLE_PROVIDER_PRIORITY_APPLICATION
    );
}

void MainWindow::setStatus(const StatusMessage& status) {
    gtk_label_set_text(GTK_LABEL(statusLabel_), status.text.c_str());
    for (const char* c : kStatusClasses) gtk_widget_remove_css_class(statusLabel_, c);
    gtk_widget_add_css_class(statusLabel_, statusClass(status.level));
}

void MainWindow::setFetching(bool fetching) {
    gtk_widget_set_sensitive(refreshButton_, !fetching);
}

void MainWindow::syncPages() {
    const AppState& state = coordinator_.state();

    std::vector<std::string> gone;
    for (const auto& entry : stockPanels_) {
        if (!state.isTracked(entry.first)) gone.push_back(entry.first);
    }
    for (const auto& sym : gone) {
        int page = gtk_notebook_page_num(GTK_NOTEBOOK(notebook_), stockPanels_[sym]->getWidget());
        if (page >= 0) gtk_notebook_remove_page(GTK_NOTEBOOK(notebook_), page);
        stockPanels_.erase(sym);
    }

    for (const auto& sym : state.symbols) {
        if (stockPanels_.count(sym)) continue;
        auto panel = std::make_unique<StockPanel>(sym);
        gtk_notebook_append_page(GTK_NOTEBOOK(notebook_), panel->getWidget(), gtk_label_new(sym.c_str()));
        panel->update(state.snapshot(sym), state.settings.timezone);
        stockPanels_[sym] = std::move(panel);
    }
}

void MainWindow::syncRangeSelector() {
    const auto& ranges = timeRanges();
    for (guint i = 0; i < ranges.size(); ++i) {
        if (ranges[i].range != coordinator_.state().activeRange) continue;
        if (gtk_drop_down_get_selected(GTK_DROP_DOWN(rangeCombo_)) != i) {
            syncingRange_ = true;
            gtk_drop_down_set_selected(GTK_DROP_DOWN(rangeCombo_), i);
            syncingRange_ = false;
        }
        return;
    }
}

void MainWindow::refreshState() {
    syncPages();
    syncRangeSelector();
    monitorPanel_->update(coordinator_.state());
}

void MainWindow::refreshData() {
    const AppState& state = coordinator_.state();
    syncPages();
    for (auto& entry : stockPanels_) {
        entry.second->update(state.snapshot(entry.first), state.settings.timezone);
    }
    monitorPanel_->update(state);
}

std::string MainWindow::currentPageSymbol() const {
    int current = gtk_notebook_get_current_page(GTK_NOTEBOOK(notebook_));
    if (current < 0) return "";
    GtkWidget* page = gtk_notebook_get_nth_page(GTK_NOTEBOOK(notebook_), current);
    for (const auto& entry : stockPanels_) {
        if (entry.second->getWidget() == page) return entry.first;
    }
    return "";
}

void MainWindow::onAddClicked(GtkButton*, gpointer userData) {
    auto* self = static_cast<MainWindow*>(userData);
    std::string input = gtk_editable_get_text(GTK_EDITABLE(self->symbolEntry_));
    if (self->coordinator_.addSymbol(input) == AddResult::Added) {
        gtk_editable_set_text(GTK_EDITABLE(self->symbolEntry_), "");
    }
}

void MainWindow::onEntryActivate(GtkEntry*, gpointer userData) {
    onAddClicked(nullptr, userData);
}

void MainWindow::onRemoveClicked(GtkButton*, gpointer userData) {
    auto* self = static_cast<MainWindow*>(userData);
    std::string symbol = self->currentPageSymbol();
    if (symbol.empty()) {
        self->setStatus(StatusMessage{StatusMessage::Level::Error, "Status: Cannot remove the Main Monitor tab."});
        return;
    }
    self->coordinator_.removeSymbol(symbol);
}

void MainWindow::onRefreshClicked(GtkButton*, gpointer userData) {
    auto* self = static_cast<MainWindow*>(userData);
    self->coordinator_.requestFetch(FetchReason::Manual);
}

void MainWindow::onSettingsClicked(GtkButton*, gpointer userData) {
    auto* self = static_cast<MainWindow*>(userData);
    RefreshCoordinator* coordinator = &self->coordinator_;
    SettingsDialog::present(GTK_WINDOW(self->window_), coordinator->state().settings,
                            [coordinator](const Settings& settings) { coordinator->applySettings(settings); });
}

void MainWindow::onRangeChanged(GObject* dropDown, GParamSpec*, gpointer userData) {
    auto* self = static_cast<MainWindow*>(userData);
    if (self->syncingRange_) return;
    guint idx = gtk_drop_down_get_selected(GTK_DROP_DOWN(dropDown));
    const auto& ranges = timeRanges();
    if (idx < ranges.size()) self->coordinator_.setActiveRange(ranges[idx].range);
}

void MainWindow::onSwitchPage(GtkNotebook*, GtkWidget* page, guint, gpointer userData) {
    auto* self = static_cast<MainWindow*>(userData);
    if (!self->tabFetchEnabled_) return;

    if (page == self->monitorPanel_->getWidget()) {
        self->monitorPanel_->update(self->coordinator_.state());
        return;
    }
    spdlog::info("TAB: Switched to a share page, fetching");
    self->coordinator_.requestFetch(FetchReason::TabChanged);
}

}
