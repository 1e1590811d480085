#include "ui/SettingsDialog.hpp"
#include <spdlog/spdlog.h>
#include <string>
#include <utility>

namespace ShareMonitor {

namespace {

struct SettingsDialogData {
    GtkWidget* dialog;
    GtkWidget* rangeCombo;
    GtkWidget* zoneCombo;
    SettingsDialog::SaveCallback onSave;
};

GtkWidget* makeRow(const char* title, GtkWidget* control) {
    GtkWidget* row = gtk_box_new(GTK_ORIENTATION_HORIZONTAL, 12);
    GtkWidget* label = gtk_label_new(title);
    gtk_label_set_xalign(GTK_LABEL(label), 0);
    gtk_widget_set_hexpand(label, TRUE);
    gtk_box_append(GTK_BOX(row), label);
    gtk_box_append(GTK_BOX(row), control);
    return row;
}

void onSaveClicked(GtkButton* btn, gpointer) {
    auto* d = static_cast<SettingsDialogData*>(g_object_get_data(G_OBJECT(btn), "data"));
    if (!d) return;

    Settings settings;
    guint rangeIdx = gtk_drop_down_get_selected(GTK_DROP_DOWN(d->rangeCombo));
    const auto& ranges = timeRanges();
    if (rangeIdx < ranges.size()) settings.timeRange = ranges[rangeIdx].range;

    guint zoneIdx = gtk_drop_down_get_selected(GTK_DROP_DOWN(d->zoneCombo));
    const auto& zones = supportedTimezones();
    if (zoneIdx < zones.size()) settings.timezone = zones[zoneIdx];

    spdlog::info("SETTINGS: Saving range {}, timezone {}", timeRangeSpec(settings.timeRange).label, settings.timezone);
    // Copy out first; closing the window frees d
    SettingsDialog::SaveCallback onSave = d->onSave;
    gtk_window_close(GTK_WINDOW(d->dialog));
    if (onSave) onSave(settings);
}

}

void SettingsDialog::present(GtkWindow* parent, const Settings& current, SaveCallback onSave) {
    GtkWidget* dialog = gtk_window_new();
    gtk_window_set_title(GTK_WINDOW(dialog), "Settings");
    gtk_window_set_default_size(GTK_WINDOW(dialog), 340, 200);
    gtk_window_set_modal(GTK_WINDOW(dialog), TRUE);
    if (parent) gtk_window_set_transient_for(GTK_WINDOW(dialog), parent);

    GtkWidget* box = gtk_box_new(GTK_ORIENTATION_VERTICAL, 12);
    gtk_widget_set_margin_start(box, 16);
    gtk_widget_set_margin_end(box, 16);
    gtk_widget_set_margin_top(box, 16);
    gtk_widget_set_margin_bottom(box, 16);

    GtkStringList* rangeList = gtk_string_list_new(nullptr);
    guint rangeSel = 0;
    const auto& ranges = timeRanges();
    for (guint i = 0; i < ranges.size(); ++i) {
        gtk_string_list_append(rangeList, ranges[i].label);
        if (ranges[i].range == current.timeRange) rangeSel = i;
    }
    GtkWidget* rangeCombo = gtk_drop_down_new(nullptr, nullptr);
    gtk_drop_down_set_model(GTK_DROP_DOWN(rangeCombo), G_LIST_MODEL(rangeList));
    gtk_drop_down_set_selected(GTK_DROP_DOWN(rangeCombo), rangeSel);
    g_object_unref(rangeList);
    gtk_box_append(GTK_BOX(box), makeRow("Default Chart Range:", rangeCombo));

    GtkStringList* zoneList = gtk_string_list_new(nullptr);
    guint zoneSel = 0;
    const auto& zones = supportedTimezones();
    for (guint i = 0; i < zones.size(); ++i) {
        gtk_string_list_append(zoneList, zones[i].c_str());
        if (zones[i] == current.timezone) zoneSel = i;
    }
    GtkWidget* zoneCombo = gtk_drop_down_new(nullptr, nullptr);
    gtk_drop_down_set_model(GTK_DROP_DOWN(zoneCombo), G_LIST_MODEL(zoneList));
    gtk_drop_down_set_selected(GTK_DROP_DOWN(zoneCombo), zoneSel);
    g_object_unref(zoneList);
    gtk_box_append(GTK_BOX(box), makeRow("Timezone:", zoneCombo));

    GtkWidget* spacer = gtk_box_new(GTK_ORIENTATION_VERTICAL, 0);
    gtk_widget_set_vexpand(spacer, TRUE);
    gtk_box_append(GTK_BOX(box), spacer);

    GtkWidget* btnBox = gtk_box_new(GTK_ORIENTATION_HORIZONTAL, 12);
    gtk_widget_set_halign(btnBox, GTK_ALIGN_CENTER);
    GtkWidget* cancelBtn = gtk_button_new_with_label("Cancel");
    g_signal_connect_swapped(cancelBtn, "clicked", G_CALLBACK(gtk_window_close), dialog);
    gtk_box_append(GTK_BOX(btnBox), cancelBtn);

    GtkWidget* saveBtn = gtk_button_new_with_label("Save and Refresh");
    gtk_widget_add_css_class(saveBtn, "suggested-action");
    auto* data = new SettingsDialogData{dialog, rangeCombo, zoneCombo, std::move(onSave)};
    g_object_set_data_full(G_OBJECT(saveBtn), "data", data,
                           [](gpointer p) { delete static_cast<SettingsDialogData*>(p); });
    g_signal_connect(saveBtn, "clicked", G_CALLBACK(onSaveClicked), nullptr);
    gtk_box_append(GTK_BOX(btnBox), saveBtn);
    gtk_box_append(GTK_BOX(box), btnBox);

    gtk_window_set_child(GTK_WINDOW(dialog), box);
    gtk_window_present(GTK_WINDOW(dialog));
}

}
