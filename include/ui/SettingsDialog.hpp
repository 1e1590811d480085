#pragma once
#include <gtk/gtk.h>
#include <functional>
#include "utils/Config.hpp"

namespace ShareMonitor {

// Modal window with the default chart range and display time zone.
// onSave runs when "Save and Refresh" is pressed; the window then closes.
class SettingsDialog {
public:
    using SaveCallback = std::function<void(const Settings&)>;

    static void present(GtkWindow* parent, const Settings& current, SaveCallback onSave);
};

}
