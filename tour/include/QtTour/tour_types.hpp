#pragma once

/**
 * @file tour_types.hpp
 * @brief Type definitions shared by the guided tour components
 *
 * Holds the tour state enum, bubble placement, and the TourSettings
 * configuration block.
 */

#include <QColor>
#include <QString>

namespace QtTour {

/**
 * @brief Lifecycle state of the tour manager
 */
enum class TourState {
  Idle,   // No tour is running
  Running // A tour is running (a step may or may not be active)
};

/**
 * @brief Side of the highlight the message bubble is attached to
 */
enum class BubblePlacement {
  None,  // No bubble (pointer glyph is shown instead)
  Right, // Right of the highlight (preferred)
  Left   // Left of the highlight (when the right side is off-screen)
};

/**
 * @brief Configuration applied to subsequently activated steps
 */
struct TourSettings {
  QColor coachColor = QColor(Qt::darkBlue); // Border, glow and mask tint
  int padding = 10;          // Margin between target and highlight border
  bool maskEnabled = false;  // Dim the window around the target
  qreal maskOpacity = 0.45;  // Alpha of the dimming mask
  int glowRadius = 20;       // Peak blur radius of the highlight glow
  int glowDurationMs = 600;  // Duration of one glow cycle
  bool confirmCancel = true; // Ask before escape terminates the tour
};

/**
 * @brief Convert TourState to string
 */
inline QString tourStateToString(TourState s) {
  switch (s) {
    case TourState::Idle: return "idle";
    case TourState::Running: return "running";
  }
  return "idle";
}

/**
 * @brief Convert BubblePlacement to string
 */
inline QString placementToString(BubblePlacement p) {
  switch (p) {
    case BubblePlacement::None: return "none";
    case BubblePlacement::Right: return "right";
    case BubblePlacement::Left: return "left";
  }
  return "none";
}

} // namespace QtTour
