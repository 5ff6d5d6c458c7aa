#include "geometry/layout_config.hpp"
#include "core/log.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <string>

namespace tg::geometry {

namespace {

void apply_env(const char* name, double& field) {
    const char* raw = std::getenv(name);
    if (raw == nullptr || *raw == '\0') {
        return;
    }
    char* end = nullptr;
    errno = 0;
    double value = std::strtod(raw, &end);
    if (errno != 0 || end == raw || *end != '\0' || !std::isfinite(value)) {
        tg::log::warn(std::string("LayoutConfig: ignoring unparsable ") + name + "='" + raw + "'");
        return;
    }
    field = value;
}

void clamp_field(const char* name, double& field, double fallback, double minimum) {
    if (!std::isfinite(field)) {
        tg::log::warn(std::string("LayoutConfig: ") + name + " is not finite, using " + std::to_string(fallback));
        field = fallback;
        return;
    }
    if (field < minimum) {
        tg::log::warn(std::string("LayoutConfig: ") + name + "=" + std::to_string(field) +
                      " below minimum, clamped to " + std::to_string(minimum));
        field = minimum;
    }
}

} // namespace

LayoutConfig LayoutConfig::from_environment() {
    LayoutConfig cfg;
    apply_env("TG_TRACK_HEIGHT", cfg.track_height);
    apply_env("TG_TRACK_GAP", cfg.track_gap);
    apply_env("TG_TRACK_MARGIN_TOP", cfg.track_margin_top);
    apply_env("TG_RULER_HEIGHT", cfg.ruler_height);
    apply_env("TG_TRACK_NAME_WIDTH", cfg.track_name_width);
    apply_env("TG_SCROLLBAR_THICKNESS", cfg.scroll_bar_thickness);
    apply_env("TG_MIN_HANDLE_SIZE", cfg.min_scroll_handle);
    return cfg.sanitized();
}

LayoutConfig LayoutConfig::sanitized() const {
    const LayoutConfig defaults;
    LayoutConfig cfg = *this;
    clamp_field("ruler_height", cfg.ruler_height, defaults.ruler_height, 0.0);
    clamp_field("min_track_name_width", cfg.min_track_name_width, defaults.min_track_name_width, 0.0);
    clamp_field("track_name_width", cfg.track_name_width, defaults.track_name_width, cfg.min_track_name_width);
    clamp_field("scroll_bar_thickness", cfg.scroll_bar_thickness, defaults.scroll_bar_thickness, 0.0);
    clamp_field("min_scroll_handle", cfg.min_scroll_handle, defaults.min_scroll_handle, 0.0);
    clamp_field("resize_handle_width", cfg.resize_handle_width, defaults.resize_handle_width, 0.0);
    clamp_field("project_handle_width", cfg.project_handle_width, defaults.project_handle_width, 0.0);
    clamp_field("track_height", cfg.track_height, defaults.track_height, 0.0);
    clamp_field("track_gap", cfg.track_gap, defaults.track_gap, 0.0);
    clamp_field("track_margin_top", cfg.track_margin_top, defaults.track_margin_top, 0.0);
    clamp_field("paint_margin_min", cfg.paint_margin_min, defaults.paint_margin_min, 0.0);
    clamp_field("paint_margin_fraction", cfg.paint_margin_fraction, defaults.paint_margin_fraction, 0.0);
    clamp_field("marker_icon_width", cfg.marker_icon_width, defaults.marker_icon_width, 0.0);
    clamp_field("marker_icon_height", cfg.marker_icon_height, defaults.marker_icon_height, 0.0);
    clamp_field("marker_hit_padding", cfg.marker_hit_padding, defaults.marker_hit_padding, 0.0);
    if (!std::isfinite(cfg.marker_icon_offset_y)) {
        cfg.marker_icon_offset_y = defaults.marker_icon_offset_y;
    }
    if (!std::isfinite(cfg.default_tick_pixels) || cfg.default_tick_pixels <= 0.0) {
        tg::log::warn("LayoutConfig: default_tick_pixels must be positive, using 100");
        cfg.default_tick_pixels = defaults.default_tick_pixels;
    }
    return cfg;
}

} // namespace tg::geometry
