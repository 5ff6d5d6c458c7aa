#pragma once
#include "core/rect.hpp"

namespace tg::geometry {

/**
 * @brief One scroll axis: fractional visible window over the content.
 *
 * After update(): 0 <= start() <= end() <= 1, and end() - start() equals
 * view/content whenever the content is larger than the view, else the window
 * is [0, 1] with zero offset.
 */
class ScrollModel {
public:
    // Requested start fraction; clamped on the next update()
    void set_start(double fraction);

    // Recompute for new sizes. pin_end places the window at the content's end.
    // Returns the pixel scroll offset.
    double update(double content_size, double view_size, bool pin_end = false);

    double start() const { return start_; }
    double end() const { return end_; }
    double content_size() const { return content_; }
    double view_size() const { return view_; }
    double ratio() const { return ratio_; }
    double offset() const { return offset_; }
    double max_offset() const;
    bool scrollable() const { return ratio_ < 1.0; }

    struct Handle {
        double pos = 0.0;     // along the scrollbar track, from its origin
        double length = 0.0;
        bool visible = false;
    };
    // Handle proportional to ratio() (never shorter than min_length)
    Handle handle(double min_length) const;

private:
    double start_ = 0.0;
    double end_ = 1.0;
    double content_ = 0.0;
    double view_ = 0.0;
    double ratio_ = 1.0;
    double offset_ = 0.0;
};

// Where the two scrollbars live on the canvas
struct ScrollbarFrame {
    double track_left = 0.0;   // x of the horizontal bar track (right of the name gutter)
    double h_bar_top = 0.0;    // y of the horizontal bar
    double track_top = 0.0;    // y of the vertical bar track (below the ruler)
    double v_bar_left = 0.0;   // x of the vertical bar
    double thickness = 12.0;
    double min_handle = 20.0;
};

struct ViewMetrics {
    double view_w = 0.0;
    double view_h = 0.0;
    double timeline_w = 0.0;
    double content_h = 0.0;
    double h_offset = 0.0;
    double v_offset = 0.0;
};

/**
 * @brief Keeps both scroll axes and their handle rects in step with content size.
 *
 * Knows nothing about clips or tracks; the geometry cache feeds it content and
 * view extents after a rebuild or a pure resize.
 */
class ViewportSynchronizer {
public:
    void set_frame(const ScrollbarFrame& frame) { frame_ = frame; }
    const ScrollbarFrame& frame() const { return frame_; }

    double update_horizontal(double content_width, double view_width);
    double update_vertical(double content_height, double view_height);

    // While set, the horizontal window tracks the content's right edge
    void set_keep_right(bool keep) { keep_right_ = keep; }
    bool keep_right() const { return keep_right_; }
    bool is_right_aligned() const;

    void scroll_horizontal_to(double fraction) { horizontal_.set_start(fraction); }
    void scroll_vertical_to(double fraction) { vertical_.set_start(fraction); }

    const ScrollModel& horizontal() const { return horizontal_; }
    const ScrollModel& vertical() const { return vertical_; }
    const RectF& h_handle_rect() const { return h_handle_; }
    const RectF& v_handle_rect() const { return v_handle_; }

    ViewMetrics metrics() const;

private:
    ScrollbarFrame frame_;
    ScrollModel horizontal_;
    ScrollModel vertical_;
    RectF h_handle_;
    RectF v_handle_;
    bool keep_right_ = false;
};

} // namespace tg::geometry
