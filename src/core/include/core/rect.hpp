#pragma once

/**
 * Geometric value types shared by the geometry cache and its consumers.
 * Double precision throughout: content widths of long projects at high zoom
 * exceed what float can address to the pixel.
 */

#include <cmath>

namespace tg {

struct PointF {
    double x = 0.0;
    double y = 0.0;

    PointF() = default;
    PointF(double x_val, double y_val) : x(x_val), y(y_val) {}

    bool operator==(const PointF& other) const { return x == other.x && y == other.y; }
    bool operator!=(const PointF& other) const { return !(*this == other); }
};

struct RectF {
    double x = 0.0;
    double y = 0.0;
    double w = 0.0;
    double h = 0.0;

    RectF() = default;
    RectF(double x_val, double y_val, double width, double height)
        : x(x_val), y(y_val), w(width), h(height) {}

    double left() const { return x; }
    double top() const { return y; }
    double right() const { return x + w; }
    double bottom() const { return y + h; }

    // Null and negative extents are never hit and never visible
    bool is_empty() const { return !(w > 0.0) || !(h > 0.0); }

    bool contains(const PointF& p) const {
        if (is_empty()) return false;
        return p.x >= x && p.x <= right() && p.y >= y && p.y <= bottom();
    }

    RectF translated(double dx, double dy) const { return RectF{x + dx, y + dy, w, h}; }
    void translate(double dx, double dy) { x += dx; y += dy; }

    RectF adjusted(double dl, double dt, double dr, double db) const {
        return RectF{x + dl, y + dt, w - dl + dr, h - dt + db};
    }

    bool operator==(const RectF& other) const {
        return x == other.x && y == other.y && w == other.w && h == other.h;
    }
    bool operator!=(const RectF& other) const { return !(*this == other); }
};

// Replace NaN/inf with a fallback; project data may carry either.
inline double finite_or(double value, double fallback) {
    return std::isfinite(value) ? value : fallback;
}

} // namespace tg
