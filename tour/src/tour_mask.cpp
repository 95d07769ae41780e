/**
 * @file tour_mask.cpp
 * @brief Implementation of the tour dimming mask
 */

#include "QtTour/tour_mask.hpp"
#include "QtTour/tour_geometry.hpp"
#include <QEvent>
#include <QPainter>
#include <QPainterPath>

namespace QtTour {

TourMask::TourMask(QWidget *window, const QColor &color, qreal opacity)
    : QWidget(window) {
  setAttribute(Qt::WA_TransparentForMouseEvents);
  setAttribute(Qt::WA_NoSystemBackground);
  setColor(color, opacity);
  if (window) {
    window->installEventFilter(this);
    setGeometry(window->rect());
  }
}

void TourMask::attachTo(QWidget *window) {
  if (!window) {
    return;
  }

  if (parentWidget() != window) {
    if (parentWidget()) {
      parentWidget()->removeEventFilter(this);
    }
    setParent(window);
    window->installEventFilter(this);
  }

  setGeometry(window->rect());
  show();
  raise();
}

void TourMask::setCutout(const QRect &globalRect) {
  if (parentWidget()) {
    m_cutout =
        QRect(parentWidget()->mapFromGlobal(globalRect.topLeft()),
              globalRect.size());
  } else {
    m_cutout = globalRect;
  }
  update();
}

void TourMask::setColor(const QColor &color, qreal opacity) {
  m_color = color;
  m_color.setAlphaF(static_cast<float>(opacity));
  update();
}

QRegion TourMask::maskedRegion() const {
  return geometry::cutoutRegion(rect(), m_cutout);
}

void TourMask::paintEvent(QPaintEvent *event) {
  Q_UNUSED(event)

  QPainter painter(this);
  painter.setRenderHint(QPainter::Antialiasing);

  QPainterPath overlayPath;
  overlayPath.addRect(rect());

  if (m_cutout.isValid()) {
    QPainterPath cutoutPath;
    cutoutPath.addRoundedRect(m_cutout, CUTOUT_RADIUS, CUTOUT_RADIUS);
    overlayPath = overlayPath.subtracted(cutoutPath);
  }

  painter.fillPath(overlayPath, m_color);
}

bool TourMask::eventFilter(QObject *watched, QEvent *event) {
  if (watched == parentWidget() && event->type() == QEvent::Resize) {
    // Follow the window; the cutout is not re-derived
    setGeometry(parentWidget()->rect());
  }
  return QWidget::eventFilter(watched, event);
}

} // namespace QtTour
