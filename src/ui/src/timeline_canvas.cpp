#include "ui/timeline_canvas.hpp"
#include "core/log.hpp"

#include <QPainter>
#include <QMouseEvent>
#include <QWheelEvent>
#include <QResizeEvent>
#include <algorithm>
#include <variant>

namespace tg::ui {

using tg::geometry::HitRegion;

TimelineCanvas::TimelineCanvas(tg::timeline::Project& project, QWidget* parent)
    : QWidget(parent)
    , project_(project)
    , cache_(std::make_unique<tg::geometry::GeometryCache>(project, tg::geometry::LayoutConfig::from_environment())) {
    setMouseTracking(true);
    project_.set_modified_callback([this]() {
        cache_->mark_dirty();
        update();
    });
}

TimelineCanvas::~TimelineCanvas() {
    project_.set_modified_callback({});
}

void TimelineCanvas::set_zoom(double zoom_factor) {
    cache_->set_zoom_factor(std::clamp(zoom_factor, 0.01, 1000.0));
    update();
}

void TimelineCanvas::refresh() {
    cache_->mark_dirty();
    update();
}

void TimelineCanvas::paintEvent(QPaintEvent*) {
    QPainter painter(this);
    painter.setRenderHint(QPainter::Antialiasing, false); // Crisp lines for timeline
    painter.fillRect(rect(), QColor(32, 32, 32));

    const auto& cfg = cache_->config();
    painter.fillRect(QRectF(0, 0, width(), cfg.ruler_height), QColor(45, 45, 45));

    for (const auto& track : cache_->iter_tracks()) {
        painter.setPen(QColor(70, 70, 70));
        painter.drawRect(to_qrect(track.rect));
        painter.fillRect(to_qrect(track.name_rect), QColor(50, 50, 50));
        if (track.track) {
            painter.setPen(QColor(200, 200, 200));
            painter.drawText(to_qrect(track.name_rect).adjusted(6, 0, 0, 0),
                             Qt::AlignVCenter | Qt::AlignLeft,
                             QString::fromStdString(track.track->label));
        }
        if (track.panel_rect) {
            painter.fillRect(to_qrect(*track.panel_rect), QColor(40, 40, 48));
        }
    }

    for (const auto& item : cache_->iter_items()) {
        const bool clip = item.kind() == tg::geometry::ItemKind::Clip;
        QColor fill = clip ? QColor(70, 110, 160) : QColor(140, 90, 150);
        if (item.selected) fill = fill.lighter(140);
        painter.fillRect(to_qrect(item.rect), fill);
        painter.setPen(item.selected ? QColor(255, 220, 120) : QColor(20, 20, 20));
        painter.drawRect(to_qrect(item.rect));
        if (!clip) {
            // Fade direction: rising for a normal transition, falling when reversed
            const QRectF r = to_qrect(item.rect);
            const auto* transition = std::get<const tg::timeline::Transition*>(item.item);
            if (transition->reversed) {
                painter.drawLine(r.topLeft(), r.bottomRight());
            } else {
                painter.drawLine(r.bottomLeft(), r.topRight());
            }
        }
    }

    painter.setPen(QColor(230, 180, 60));
    for (const auto& marker : cache_->iter_markers()) {
        painter.drawRect(to_qrect(marker.line_rect));
        if (marker.icon_rect) {
            painter.fillRect(to_qrect(*marker.icon_rect), QColor(230, 180, 60));
        }
    }

    painter.fillRect(to_qrect(cache_->h_scrollbar_rect()), QColor(110, 110, 110));
    painter.fillRect(to_qrect(cache_->v_scrollbar_rect()), QColor(110, 110, 110));
    painter.fillRect(to_qrect(cache_->timeline_handle_rect()), QColor(90, 90, 90));
}

void TimelineCanvas::resizeEvent(QResizeEvent* event) {
    QWidget::resizeEvent(event);
    cache_->set_canvas_size(width(), height());
    // Auto-height rows depend on the view height, which only a rebuild picks up
    if (cache_->config().track_height <= 0.0) {
        cache_->mark_dirty();
    } else {
        cache_->refresh_viewport();
    }
    update();
}

void TimelineCanvas::wheelEvent(QWheelEvent* event) {
    const double delta = event->angleDelta().y() / 120.0; // Standard wheel step
    if (event->modifiers() & Qt::ControlModifier) {
        // Zoom: larger factor shows more seconds per tick
        set_zoom(zoom_factor() * (1.0 - delta * 0.1));
    } else if (event->modifiers() & Qt::ShiftModifier) {
        cache_->scroll_by_pixels(0.0, -delta * 40.0);
        update();
    } else {
        cache_->scroll_by_pixels(-delta * 40.0, 0.0);
        update();
    }
    event->accept();
}

void TimelineCanvas::mouseMoveEvent(QMouseEvent* event) {
    update_cursor(event->position());
    QWidget::mouseMoveEvent(event);
}

void TimelineCanvas::update_cursor(const QPointF& pos) {
    const auto result = cache_->hit(from_qpoint(pos));
    switch (result.region) {
        case HitRegion::Clip:
        case HitRegion::Transition:
            setCursor(Qt::OpenHandCursor);
            break;
        case HitRegion::Handle:
        case HitRegion::TimelineHandle:
            setCursor(Qt::SizeHorCursor);
            break;
        case HitRegion::Ruler:
            setCursor(Qt::IBeamCursor);
            break;
        default:
            setCursor(Qt::ArrowCursor);
            break;
    }
    if (result.region != hover_region_) {
        hover_region_ = result.region;
        tg::log::trace(std::string("TimelineCanvas hover: ") + tg::geometry::to_string(result.region));
        emit hover_region_changed(static_cast<int>(result.region));
    }
}

} // namespace tg::ui
