/**
 * @file tour_geometry.cpp
 * @brief Implementation of coachmark and mask placement math
 */

#include "QtTour/tour_geometry.hpp"
#include <QWidget>
#include <QtGlobal>

namespace QtTour::geometry {

QRect globalRect(const QWidget *widget) {
  if (!widget) {
    return QRect();
  }
  return QRect(widget->mapToGlobal(QPoint(0, 0)), widget->size());
}

QRect highlightRect(const QRect &target, int padding) {
  return target.adjusted(-padding, -padding, padding, padding);
}

BubbleLayout placeBubble(const QRect &highlight, const QSize &bubbleSize,
                         const QRect &bounds) {
  BubbleLayout layout;
  if (bubbleSize.isEmpty()) {
    return layout;
  }

  const int width = bubbleSize.width();
  const int height = bubbleSize.height();

  int x = highlight.right() + 1 + ARROW_SIZE;
  int y = highlight.center().y() - height / 2;
  layout.placement = BubblePlacement::Right;

  if (bounds.isValid()) {
    const bool overflowsRight = x + width - 1 > bounds.right();
    const int leftX = highlight.left() - ARROW_SIZE - width;
    if (overflowsRight && leftX >= bounds.left()) {
      x = leftX;
      layout.placement = BubblePlacement::Left;
    }

    // Top edge wins when the bubble is taller than the screen
    y = qMax(bounds.top(), qMin(y, bounds.bottom() - height + 1));
  }

  layout.rect = QRect(x, y, width, height);
  layout.arrow = arrowPolygon(highlight, layout.rect, layout.placement);
  return layout;
}

QPolygon arrowPolygon(const QRect &highlight, const QRect &bubble,
                      BubblePlacement placement) {
  QPolygon arrow;
  if (placement == BubblePlacement::None || !bubble.isValid()) {
    return arrow;
  }

  const int half = ARROW_SIZE / 2;
  int tipY = highlight.center().y();
  if (bubble.height() > ARROW_SIZE * 2) {
    tipY = qBound(bubble.top() + ARROW_SIZE, tipY, bubble.bottom() - ARROW_SIZE);
  }

  if (placement == BubblePlacement::Right) {
    arrow << QPoint(bubble.left(), tipY - half)
          << QPoint(highlight.right() + 1, tipY)
          << QPoint(bubble.left(), tipY + half);
  } else {
    arrow << QPoint(bubble.right() + 1, tipY - half)
          << QPoint(highlight.left(), tipY)
          << QPoint(bubble.right() + 1, tipY + half);
  }
  return arrow;
}

QRect pointerRect(const QRect &highlight, const QSize &glyph) {
  const QPoint corner = highlight.bottomRight();
  return QRect(corner - QPoint(glyph.width() / 2, glyph.height() / 2), glyph);
}

QRegion cutoutRegion(const QRect &area, const QRect &cutout) {
  return QRegion(area).subtracted(QRegion(cutout));
}

} // namespace QtTour::geometry
