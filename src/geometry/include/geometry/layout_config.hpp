#pragma once

namespace tg::geometry {

/**
 * Layout constants for the timeline canvas.
 *
 * All values are in device-independent pixels. A track_height of 0 selects
 * auto height: the view height divided evenly among the tracks.
 */
struct LayoutConfig {
    // Chrome around the scrollable content
    double ruler_height = 40.0;
    double track_name_width = 140.0;
    double min_track_name_width = 40.0;
    double scroll_bar_thickness = 12.0;
    double min_scroll_handle = 20.0;

    // Drag handles
    double resize_handle_width = 6.0;    // gutter/content separator
    double project_handle_width = 10.0;  // project duration, right edge of content

    // Track stacking
    double track_height = 48.0;
    double track_gap = 8.0;
    double track_margin_top = 8.0;

    // Entries this far outside the view are still yielded to painters
    double paint_margin_min = 64.0;
    double paint_margin_fraction = 0.25;

    // Marker icon placement relative to the marker x; offset_x defaults to -width/2
    double marker_icon_width = 8.0;
    double marker_icon_height = 10.0;
    double marker_icon_offset_y = -6.0;
    double marker_hit_padding = 0.0;

    // Used when the project reports a non-positive tick scale
    double default_tick_pixels = 100.0;

    // Defaults overridden by TG_* environment variables where set and parsable
    static LayoutConfig from_environment();

    // Copy with negative or non-finite values replaced; changes are logged
    LayoutConfig sanitized() const;
};

} // namespace tg::geometry
