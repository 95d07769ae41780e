#pragma once

/**
 * @file coachmark.hpp
 * @brief Visual affordance framing the active tour target
 *
 * A coachmark is a frameless tool window kept on top, made of:
 * - a dashed, glowing border around the target (target bounds + padding)
 * - an optional message bubble to one side, with an optional action button
 * - a pointer glyph at the highlight corner when there is no message
 *
 * Geometry is computed once at construction. If the target moves or
 * resizes afterwards the coachmark stays where it was.
 */

#include "tour_geometry.hpp"
#include "tour_types.hpp"
#include <QPolygon>
#include <QRect>
#include <QWidget>
#include <functional>
#include <utility>

class QFrame;
class QLabel;
class QPushButton;
class QGraphicsDropShadowEffect;
class QPropertyAnimation;

namespace QtTour {

class Coachmark : public QWidget {
  Q_OBJECT

public:
  /**
   * @brief Callback asked before escape cancels the tour
   * @return true to cancel
   */
  using CancelConfirmation = std::function<bool(QWidget *)>;

  /**
   * @brief Construct a coachmark over @p target
   * @param target Widget to frame (read once for geometry)
   * @param settings Color, padding and glow parameters
   * @param message Bubble text (empty = pointer glyph instead of bubble)
   * @param action Label of the bubble's action button (empty = none)
   * @param parent Window the coachmark stays above
   */
  Coachmark(QWidget *target, const TourSettings &settings,
            const QString &message = QString(),
            const QString &action = QString(), QWidget *parent = nullptr);
  ~Coachmark() override;

  /**
   * @brief Highlight rectangle in global coordinates
   */
  [[nodiscard]] QRect highlightRect() const { return m_highlightRect; }

  /**
   * @brief Bubble rectangle in global coordinates (empty without message)
   */
  [[nodiscard]] QRect bubbleRect() const { return m_bubbleRect; }

  /**
   * @brief Pointer glyph rectangle in global coordinates (empty with message)
   */
  [[nodiscard]] QRect pointerRect() const { return m_pointerRect; }

  [[nodiscard]] BubblePlacement placement() const { return m_placement; }
  [[nodiscard]] bool hasBubble() const { return !m_bubbleRect.isNull(); }
  [[nodiscard]] QColor color() const { return m_color; }
  [[nodiscard]] QPushButton *actionButton() const { return m_actionButton; }
  [[nodiscard]] bool isAnimating() const;
  [[nodiscard]] bool isConfirmingCancel() const { return m_confirming; }

  void setCancelConfirmation(CancelConfirmation confirm);

  /**
   * @brief Ask for early termination; emits cancelRequested() if confirmed
   *
   * Ignored while a confirmation is already being asked.
   */
  void requestCancel();

  /**
   * @brief Close the coachmark; any other close request is refused
   */
  void dismiss();

signals:
  /**
   * @brief The user clicked the highlight or the action button
   */
  void activated();

  /**
   * @brief The user asked to leave the tour and confirmed it
   */
  void cancelRequested();

protected:
  void paintEvent(QPaintEvent *event) override;
  void mousePressEvent(QMouseEvent *event) override;
  void mouseReleaseEvent(QMouseEvent *event) override;
  void keyPressEvent(QKeyEvent *event) override;
  void showEvent(QShowEvent *event) override;
  void hideEvent(QHideEvent *event) override;
  void closeEvent(QCloseEvent *event) override;

private:
  void setupUI(const QString &message, const QString &action);
  void layoutAround(QWidget *target, int padding);
  [[nodiscard]] QRect toLocal(const QRect &globalRect) const;

  QFrame *m_frame = nullptr;
  QFrame *m_bubble = nullptr;
  QLabel *m_messageLabel = nullptr;
  QPushButton *m_actionButton = nullptr;

  QGraphicsDropShadowEffect *m_glowEffect = nullptr;
  QPropertyAnimation *m_glowAnimation = nullptr;

  QColor m_color;
  QRect m_highlightRect;
  QRect m_bubbleRect;
  QRect m_pointerRect;
  QPolygon m_arrow;
  BubblePlacement m_placement = BubblePlacement::None;

  CancelConfirmation m_confirmCancel;
  bool m_closeSanctioned = false;
  bool m_confirming = false;
  bool m_pressedInside = false;

  static constexpr int BUBBLE_WIDTH = 240;
  static constexpr int BORDER_WIDTH = 3;
  static constexpr int BORDER_RADIUS = 5;
};

} // namespace QtTour
