#pragma once

/**
 * @file tour_geometry.hpp
 * @brief Placement math for coachmarks and the dimming mask
 *
 * Everything here works on plain rectangles in global (screen)
 * coordinates so it can be tested without creating windows. Only
 * globalRect() touches a widget.
 */

#include "tour_types.hpp"
#include <QPolygon>
#include <QRect>
#include <QRegion>
#include <QSize>

class QWidget;

namespace QtTour::geometry {

inline constexpr int ARROW_SIZE = 10;
inline constexpr int POINTER_SIZE = 24;

/**
 * @brief Result of placing a message bubble next to a highlight
 */
struct BubbleLayout {
  QRect rect;
  BubblePlacement placement = BubblePlacement::None;
  QPolygon arrow; // Triangle joining the bubble to the highlight
};

/**
 * @brief On-screen rectangle of a widget
 * @return Empty rect for a null widget
 */
QRect globalRect(const QWidget *widget);

/**
 * @brief Grow the target rectangle by @p padding on every side
 */
QRect highlightRect(const QRect &target, int padding);

/**
 * @brief Place a bubble of @p bubbleSize beside @p highlight
 * @param bounds Available screen area; an invalid rect disables clamping
 *
 * The bubble goes to the right of the highlight, vertically centered on it.
 * If it would cross the right edge of @p bounds and fits on the left it is
 * flipped to the left. The result is then clamped vertically into @p bounds.
 */
BubbleLayout placeBubble(const QRect &highlight, const QSize &bubbleSize,
                         const QRect &bounds = QRect());

/**
 * @brief Arrow triangle pointing from @p bubble at @p highlight
 */
QPolygon arrowPolygon(const QRect &highlight, const QRect &bubble,
                      BubblePlacement placement);

/**
 * @brief Rectangle of the pointer glyph shown when there is no message
 *
 * The glyph is centered on the bottom-right corner of the highlight.
 */
QRect pointerRect(const QRect &highlight,
                  const QSize &glyph = QSize(POINTER_SIZE, POINTER_SIZE));

/**
 * @brief @p area minus @p cutout
 */
QRegion cutoutRegion(const QRect &area, const QRect &cutout);

} // namespace QtTour::geometry
