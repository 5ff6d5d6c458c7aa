#pragma once
#include "geometry/geometry_cache.hpp"
#include "timeline/project.hpp"
#include <QWidget>
#include <QRectF>
#include <QPointF>
#include <memory>

namespace tg::ui {

inline QRectF to_qrect(const tg::RectF& r) { return QRectF(r.x, r.y, r.w, r.h); }
inline tg::PointF from_qpoint(const QPointF& p) { return tg::PointF{p.x(), p.y()}; }

/**
 * Timeline canvas widget. All geometry comes from the owned GeometryCache;
 * this class only translates Qt events into cache inputs and strokes the
 * rects it gets back.
 */
class TimelineCanvas : public QWidget {
    Q_OBJECT

public:
    explicit TimelineCanvas(tg::timeline::Project& project, QWidget* parent = nullptr);
    ~TimelineCanvas() override;

    tg::geometry::GeometryCache& geometry() { return *cache_; }
    double zoom_factor() const { return cache_->zoom_factor(); }

public slots:
    void set_zoom(double zoom_factor);
    void refresh();

signals:
    void hover_region_changed(int region);

protected:
    void paintEvent(QPaintEvent* event) override;
    void resizeEvent(QResizeEvent* event) override;
    void wheelEvent(QWheelEvent* event) override;
    void mouseMoveEvent(QMouseEvent* event) override;

private:
    void update_cursor(const QPointF& pos);

    tg::timeline::Project& project_;
    std::unique_ptr<tg::geometry::GeometryCache> cache_;
    tg::geometry::HitRegion hover_region_ = tg::geometry::HitRegion::Background;
};

} // namespace tg::ui
