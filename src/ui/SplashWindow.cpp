#include "ui/SplashWindow.hpp"
#include "app/StartupSequence.hpp"
#include <spdlog/spdlog.h>
#include <vector>

namespace ShareMonitor {

SplashWindow::SplashWindow(GtkApplication* app, const std::string& logoPath)
    : window_(nullptr), statusLabel_(nullptr), progressBar_(nullptr) {
    window_ = gtk_application_window_new(app);
    gtk_window_set_title(GTK_WINDOW(window_), "Loading...");
    gtk_window_set_decorated(GTK_WINDOW(window_), FALSE);
    gtk_window_set_resizable(GTK_WINDOW(window_), FALSE);
    gtk_widget_add_css_class(window_, "splash");

    GtkWidget* box = gtk_box_new(GTK_ORIENTATION_VERTICAL, 6);
    gtk_widget_set_margin_start(box, 20);
    gtk_widget_set_margin_end(box, 20);
    gtk_widget_set_margin_top(box, 20);
    gtk_widget_set_margin_bottom(box, 15);

    GtkWidget* logo = nullptr;
    if (!logoPath.empty() && g_file_test(logoPath.c_str(), G_FILE_TEST_EXISTS)) {
        logo = gtk_picture_new_for_filename(logoPath.c_str());
        gtk_widget_set_size_request(logo, 150, 150);
    } else {
        spdlog::warn("Logo not found, using text title");
        logo = gtk_label_new("ASX Share Monitor (Logo Missing)");
        gtk_widget_add_css_class(logo, "splash-title");
    }
    gtk_box_append(GTK_BOX(box), logo);

    statusLabel_ = gtk_label_new(startupStep(0).message.c_str());
    gtk_widget_add_css_class(statusLabel_, "splash-status");
    gtk_box_append(GTK_BOX(box), statusLabel_);

    progressBar_ = gtk_progress_bar_new();
    gtk_widget_set_size_request(progressBar_, 200, -1);
    gtk_widget_set_halign(progressBar_, GTK_ALIGN_CENTER);
    gtk_box_append(GTK_BOX(box), progressBar_);

    gtk_window_set_child(GTK_WINDOW(window_), box);
}

SplashWindow::~SplashWindow() {
    close();
}

void SplashWindow::show() {
    if (window_) gtk_window_present(GTK_WINDOW(window_));
}

void SplashWindow::setStep(int progress) {
    if (!window_) return;
    const StartupStep& step = startupStep(progress);
    gtk_label_set_text(GTK_LABEL(statusLabel_), step.message.c_str());
    gtk_progress_bar_set_fraction(GTK_PROGRESS_BAR(progressBar_), step.progress / 100.0);
    spdlog::debug("LOADING: {}% {}", step.progress, step.message);
}

void SplashWindow::close() {
    if (!window_) return;
    gtk_window_destroy(GTK_WINDOW(window_));
    window_ = nullptr;
}

std::string SplashWindow::findLogo() {
    std::vector<std::string> candidates;
    gchar* exe = g_file_read_link("/proc/self/exe", nullptr);
    if (exe) {
        gchar* dir = g_path_get_dirname(exe);
        gchar* path = g_build_filename(dir, "logo.png", nullptr);
        candidates.emplace_back(path);
        g_free(path);
        g_free(dir);
        g_free(exe);
    }
    candidates.emplace_back("logo.png");

    for (const auto& c : candidates) {
        if (g_file_test(c.c_str(), G_FILE_TEST_IS_REGULAR)) return c;
    }
    return "";
}

}
