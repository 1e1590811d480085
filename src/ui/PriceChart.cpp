#include "ui/PriceChart.hpp"
#include "utils/Format.hpp"
#include <spdlog/spdlog.h>
#include <cairo.h>
#include <algorithm>
#include <ctime>
#include <sstream>
#include <utility>

namespace ShareMonitor {

namespace {

const char* kChartKey = "price-chart";

const double kMarginLeft = 70.0;
const double kMarginRight = 20.0;
const double kMarginTop = 30.0;
const double kMarginBottom = 70.0;

void setColor(cairo_t* cr, const ChartColor& c, double alpha = 1.0) {
    cairo_set_source_rgba(cr, c.r, c.g, c.b, alpha);
}

void drawCentredText(cairo_t* cr, const std::string& text, double cx, double cy) {
    cairo_text_extents_t ext;
    cairo_text_extents(cr, text.c_str(), &ext);
    cairo_move_to(cr, cx - ext.width / 2 - ext.x_bearing, cy - ext.height / 2 - ext.y_bearing);
    cairo_show_text(cr, text.c_str());
}

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) lines.push_back(line);
    return lines;
}

}

PriceChart::PriceChart(std::string exportName) : exportName_(std::move(exportName)) {
    widget_ = gtk_box_new(GTK_ORIENTATION_VERTICAL, 4);

    // Held until the destructor, the page may be torn down first
    area_ = GTK_WIDGET(g_object_ref_sink(gtk_drawing_area_new()));
    gtk_widget_set_size_request(area_, 500, 280);
    gtk_widget_set_hexpand(area_, TRUE);
    gtk_widget_set_vexpand(area_, TRUE);
    gtk_widget_add_css_class(area_, "chart-area");
    gtk_drawing_area_set_draw_func(GTK_DRAWING_AREA(area_), onDraw, this, nullptr);
    g_object_set_data(G_OBJECT(area_), kChartKey, this);

    motion_ = gtk_event_controller_motion_new();
    g_signal_connect(motion_, "motion", G_CALLBACK(onMotion), this);
    g_signal_connect(motion_, "leave", G_CALLBACK(onLeave), this);
    gtk_widget_add_controller(area_, motion_);

    gtk_box_append(GTK_BOX(widget_), area_);

    GtkWidget* toolbar = gtk_box_new(GTK_ORIENTATION_HORIZONTAL, 6);
    gtk_widget_set_halign(toolbar, GTK_ALIGN_END);
    GtkWidget* saveBtn = gtk_button_new_from_icon_name("document-save-symbolic");
    gtk_widget_set_tooltip_text(saveBtn, "Save chart as PNG");
    g_signal_connect(saveBtn, "clicked", G_CALLBACK(onSaveClicked), this);
    gtk_box_append(GTK_BOX(toolbar), saveBtn);
    gtk_box_append(GTK_BOX(widget_), toolbar);
}

PriceChart::~PriceChart() {
    // A pending save dialog looks the chart up through this key
    g_object_set_data(G_OBJECT(area_), kChartKey, nullptr);
    g_signal_handlers_disconnect_by_data(motion_, this);
    gtk_drawing_area_set_draw_func(GTK_DRAWING_AREA(area_), nullptr, nullptr, nullptr);
    g_object_unref(area_);
}

void PriceChart::setData(ChartData data) {
    data_ = std::move(data);
    message_.clear();
    hover_.reset();
    gtk_widget_queue_draw(area_);
}

void PriceChart::showMessage(const std::string& text) {
    data_ = ChartData{};
    message_ = text;
    hover_.reset();
    gtk_widget_queue_draw(area_);
}

std::string PriceChart::suggestedFileName() const {
    return exportFileName(exportName_, std::time(nullptr));
}

PlotArea PriceChart::plotArea(int width, int height) const {
    PlotArea area;
    area.left = kMarginLeft;
    area.top = kMarginTop;
    area.width = std::max(0.0, width - kMarginLeft - kMarginRight);
    area.height = std::max(0.0, height - kMarginTop - kMarginBottom);
    return area;
}

void PriceChart::render(cairo_t* cr, int width, int height) const {
    cairo_set_source_rgb(cr, 0.118, 0.118, 0.118);
    cairo_paint(cr);
    cairo_select_font_face(cr, "Sans", CAIRO_FONT_SLANT_NORMAL, CAIRO_FONT_WEIGHT_NORMAL);

    if (!message_.empty() || data_.series.empty()) {
        cairo_set_source_rgb(cr, 0.9, 0.2, 0.2);
        cairo_set_font_size(cr, 14);
        drawCentredText(cr, message_.empty() ? "NO HISTORICAL DATA" : message_, width / 2.0, height / 2.0);
        return;
    }

    ChartLayout layout(data_.series, plotArea(width, height));
    if (!layout.valid()) return;
    const PlotArea& area = layout.area();

    // Axes, left and bottom spines only
    cairo_set_source_rgb(cr, 1.0, 1.0, 1.0);
    cairo_set_line_width(cr, 1.0);
    cairo_move_to(cr, area.left, area.top);
    cairo_line_to(cr, area.left, area.top + area.height);
    cairo_line_to(cr, area.left + area.width, area.top + area.height);
    cairo_stroke(cr);

    cairo_set_font_size(cr, 10);
    for (const auto& tick : priceTicks(layout.priceMin(), layout.priceMax())) {
        double y = layout.yFor(tick.value);
        cairo_move_to(cr, area.left - 4, y);
        cairo_line_to(cr, area.left, y);
        cairo_stroke(cr);
        cairo_text_extents_t ext;
        cairo_text_extents(cr, tick.label.c_str(), &ext);
        cairo_move_to(cr, area.left - 8 - ext.width, y + ext.height / 2);
        cairo_show_text(cr, tick.label.c_str());
    }

    for (const auto& tick : timeTicks(layout.timeMin(), layout.timeMax(), data_.range, data_.timezone)) {
        double x = layout.xFor(tick.value);
        double y = area.top + area.height;
        cairo_move_to(cr, x, y);
        cairo_line_to(cr, x, y + 4);
        cairo_stroke(cr);
        // Rotated 45 degrees, anchored at the tick
        cairo_text_extents_t ext;
        cairo_text_extents(cr, tick.label.c_str(), &ext);
        cairo_save(cr);
        cairo_translate(cr, x, y + 8);
        cairo_rotate(cr, -G_PI / 4);
        cairo_move_to(cr, -ext.width, ext.height);
        cairo_show_text(cr, tick.label.c_str());
        cairo_restore(cr);
    }

    cairo_set_font_size(cr, 11);
    drawCentredText(cr, data_.title, width / 2.0, kMarginTop / 2.0);
    drawCentredText(cr, timeAxisLabel(data_.range, data_.timezone), area.left + area.width / 2, height - 8.0);
    cairo_save(cr);
    cairo_translate(cr, 12.0, area.top + area.height / 2);
    cairo_rotate(cr, -G_PI / 2);
    drawCentredText(cr, data_.priceLabel, 0, 0);
    cairo_restore(cr);

    // Series lines, clipped to the plot
    cairo_save(cr);
    cairo_rectangle(cr, area.left, area.top, area.width, area.height);
    cairo_clip(cr);
    cairo_set_line_width(cr, data_.series.size() == 1 ? 2.0 : 1.5);
    for (const auto& s : data_.series) {
        if (s.points.empty()) continue;
        setColor(cr, s.color);
        bool first = true;
        for (const auto& p : s.points) {
            double x = layout.xFor(static_cast<double>(p.timestamp));
            double y = layout.yFor(p.close);
            if (first) cairo_move_to(cr, x, y);
            else cairo_line_to(cr, x, y);
            first = false;
        }
        cairo_stroke(cr);
    }
    cairo_restore(cr);

    if (data_.legend) {
        cairo_set_font_size(cr, 9);
        double y = area.top + 12;
        for (const auto& s : data_.series) {
            setColor(cr, s.color);
            cairo_rectangle(cr, area.left + 8, y - 7, 14, 3);
            cairo_fill(cr);
            cairo_move_to(cr, area.left + 28, y - 2);
            cairo_show_text(cr, s.label.c_str());
            y += 14;
        }
    }

    drawTooltip(cr, layout, width, height);
}

void PriceChart::drawTooltip(cairo_t* cr, const ChartLayout& layout, int width, int height) const {
    if (!hover_.inside || !hover_.hit) return;
    const HoverHit& hit = *hover_.hit;
    if (hit.seriesIndex >= data_.series.size()) return;
    const PlotArea& area = layout.area();

    // Crosshair and marker
    const double dash[] = {4.0, 3.0};
    cairo_set_source_rgba(cr, 1.0, 1.0, 0.0, 0.7);
    cairo_set_line_width(cr, 0.5);
    cairo_set_dash(cr, dash, 2, 0);
    cairo_move_to(cr, hit.x, area.top);
    cairo_line_to(cr, hit.x, area.top + area.height);
    cairo_stroke(cr);
    cairo_set_dash(cr, nullptr, 0, 0);
    cairo_set_source_rgb(cr, 1.0, 1.0, 0.0);
    cairo_arc(cr, hit.x, hit.y, 4.0, 0, 2 * G_PI);
    cairo_fill(cr);

    DerivedMetrics metrics;
    if (hit.seriesIndex < data_.metrics.size()) metrics = data_.metrics[hit.seriesIndex];
    const std::string text = tooltipText(data_.series[hit.seriesIndex].label, hit.point, metrics,
                                         data_.timezone, static_cast<std::int64_t>(std::time(nullptr)));
    const std::vector<std::string> lines = splitLines(text);

    cairo_set_font_size(cr, 10);
    const double lineHeight = 13.0;
    double boxWidth = 0.0;
    for (const auto& line : lines) {
        cairo_text_extents_t ext;
        cairo_text_extents(cr, line.c_str(), &ext);
        boxWidth = std::max(boxWidth, ext.x_advance);
    }
    boxWidth += 16.0;
    const double boxHeight = lines.size() * lineHeight + 10.0;

    double bx = hit.x + 8.0;
    double by = hit.y - boxHeight - 8.0;
    if (bx + boxWidth > width) bx = hit.x - boxWidth - 8.0;
    if (by < 0) by = std::min(hit.y + 8.0, height - boxHeight);

    cairo_set_source_rgba(cr, 0.118, 0.118, 0.118, 0.9);
    cairo_rectangle(cr, bx, by, boxWidth, boxHeight);
    cairo_fill_preserve(cr);
    cairo_set_source_rgb(cr, 1.0, 1.0, 0.0);
    cairo_set_line_width(cr, 1.0);
    cairo_stroke(cr);

    cairo_set_source_rgb(cr, 1.0, 1.0, 1.0);
    double ty = by + 5.0 + lineHeight - 3.0;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        cairo_select_font_face(cr, "Sans", CAIRO_FONT_SLANT_NORMAL,
                               i == 0 ? CAIRO_FONT_WEIGHT_BOLD : CAIRO_FONT_WEIGHT_NORMAL);
        cairo_move_to(cr, bx + 8.0, ty);
        cairo_show_text(cr, lines[i].c_str());
        ty += lineHeight;
    }
}

bool PriceChart::exportPng(const std::string& path) const {
    int width = gtk_widget_get_width(area_);
    int height = gtk_widget_get_height(area_);
    if (width <= 0 || height <= 0) {
        width = 800;
        height = 450;
    }

    cairo_surface_t* surface = cairo_image_surface_create(CAIRO_FORMAT_ARGB32, width, height);
    cairo_t* cr = cairo_create(surface);
    render(cr, width, height);
    cairo_destroy(cr);
    cairo_status_t status = cairo_surface_write_to_png(surface, path.c_str());
    cairo_surface_destroy(surface);

    if (status != CAIRO_STATUS_SUCCESS) {
        spdlog::error("EXPORT: Could not write {}: {}", path, cairo_status_to_string(status));
        return false;
    }
    spdlog::info("EXPORT: Saved chart to {}", path);
    return true;
}

void PriceChart::onDraw(GtkDrawingArea*, cairo_t* cr, int width, int height, gpointer userData) {
    auto* self = static_cast<PriceChart*>(userData);
    self->render(cr, width, height);
}

void PriceChart::onMotion(GtkEventControllerMotion*, double x, double y, gpointer userData) {
    auto* self = static_cast<PriceChart*>(userData);
    const int width = gtk_widget_get_width(self->area_);
    const int height = gtk_widget_get_height(self->area_);
    const PlotArea area = self->plotArea(width, height);

    std::optional<HoverHit> hit;
    const bool inside = self->message_.empty() && area.contains(x, y);
    if (inside) {
        ChartLayout layout(self->data_.series, area);
        hit = findNearestPoint(self->data_.series, layout, x);
    }

    const bool changed = inside != self->hover_.inside
        || hit.has_value() != self->hover_.hit.has_value()
        || (hit && (hit->seriesIndex != self->hover_.hit->seriesIndex
                    || hit->pointIndex != self->hover_.hit->pointIndex));
    self->hover_.inside = inside;
    self->hover_.hit = hit;
    if (changed) gtk_widget_queue_draw(self->area_);
}

void PriceChart::onLeave(GtkEventControllerMotion*, gpointer userData) {
    auto* self = static_cast<PriceChart*>(userData);
    self->hover_.reset();
    gtk_widget_queue_draw(self->area_);
}

void PriceChart::onSaveClicked(GtkButton*, gpointer userData) {
    auto* self = static_cast<PriceChart*>(userData);

    GtkFileDialog* dialog = gtk_file_dialog_new();
    gtk_file_dialog_set_title(dialog, "Save Plot Image");
    gtk_file_dialog_set_initial_name(dialog, self->suggestedFileName().c_str());

    GtkRoot* root = gtk_widget_get_root(self->area_);
    GtkWindow* parent = GTK_IS_WINDOW(root) ? GTK_WINDOW(root) : nullptr;
    // The area is kept alive for the callback; the chart itself may be gone by then
    gtk_file_dialog_save(dialog, parent, nullptr, onSaveResponse, g_object_ref(self->area_));
    g_object_unref(dialog);
}

void PriceChart::onSaveResponse(GObject* source, GAsyncResult* result, gpointer userData) {
    GtkWidget* area = static_cast<GtkWidget*>(userData);
    GError* error = nullptr;
    GFile* file = gtk_file_dialog_save_finish(GTK_FILE_DIALOG(source), result, &error);

    if (!file) {
        if (error) {
            if (!g_error_matches(error, GTK_DIALOG_ERROR, GTK_DIALOG_ERROR_DISMISSED)) {
                spdlog::warn("EXPORT: Save dialog failed: {}", error->message);
            }
            g_error_free(error);
        }
        g_object_unref(area);
        return;
    }

    auto* self = static_cast<PriceChart*>(g_object_get_data(G_OBJECT(area), kChartKey));
    char* path = g_file_get_path(file);
    if (!self) {
        spdlog::warn("EXPORT: Chart closed before it could be saved");
    } else if (path && !self->exportPng(path)) {
        spdlog::warn("EXPORT: Nothing written for {}", path);
    }
    g_free(path);
    g_object_unref(file);
    g_object_unref(area);
}

}
