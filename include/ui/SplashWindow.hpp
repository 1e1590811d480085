#pragma once
#include <gtk/gtk.h>
#include <string>

namespace ShareMonitor {

// Undecorated startup window with the logo, a step message and a progress bar
class SplashWindow {
public:
    SplashWindow(GtkApplication* app, const std::string& logoPath);
    ~SplashWindow();

    SplashWindow(const SplashWindow&) = delete;
    SplashWindow& operator=(const SplashWindow&) = delete;

    void show();
    void setStep(int progress);
    void close();

    // logo.png beside the executable, then in the working directory; empty when neither exists
    static std::string findLogo();

private:
    GtkWidget* window_;
    GtkWidget* statusLabel_;
    GtkWidget* progressBar_;
};

}
