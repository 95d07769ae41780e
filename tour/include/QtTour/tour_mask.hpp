#pragma once

/**
 * @file tour_mask.hpp
 * @brief Full-window dimming layer with a cutout around the tour target
 */

#include <QColor>
#include <QRect>
#include <QRegion>
#include <QWidget>

namespace QtTour {

/**
 * @brief Semi-transparent overlay covering a top-level window
 *
 * The mask is a child of the window it dims and follows that window's
 * resizes. It is transparent for mouse events; blocking input is the
 * InputGate's job. One instance is reused across the steps of a tour.
 */
class TourMask : public QWidget {
  Q_OBJECT

public:
  explicit TourMask(QWidget *window, const QColor &color = QColor(Qt::black),
                    qreal opacity = 0.45);
  ~TourMask() override = default;

  /**
   * @brief Cover @p window, reparenting the mask if it lives elsewhere
   */
  void attachTo(QWidget *window);

  /**
   * @brief Set the revealed rectangle, given in global coordinates
   */
  void setCutout(const QRect &globalRect);

  void setColor(const QColor &color, qreal opacity);

  /**
   * @brief Revealed rectangle in mask-local coordinates
   */
  [[nodiscard]] QRect cutout() const { return m_cutout; }

  /**
   * @brief Area actually dimmed, in mask-local coordinates
   */
  [[nodiscard]] QRegion maskedRegion() const;

protected:
  void paintEvent(QPaintEvent *event) override;
  bool eventFilter(QObject *watched, QEvent *event) override;

private:
  QRect m_cutout;
  QColor m_color;

  static constexpr int CUTOUT_RADIUS = 5;
};

} // namespace QtTour
