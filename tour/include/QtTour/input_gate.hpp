#pragma once

/**
 * @file input_gate.hpp
 * @brief Application-wide press filter used while a tour runs
 *
 * The gate lets pointer presses through only when they land on the active
 * target widget or on the active coachmark. Everything else is consumed so
 * that the spotlighted control is the only usable one.
 */

#include <QObject>
#include <QPoint>
#include <QPointer>
#include <QRect>
#include <QWidget>
#include <optional>

namespace QtTour {

/**
 * @brief Host capability for pre-dispatch input inspection
 */
class InputHook {
public:
  virtual ~InputHook() = default;

  /**
   * @brief Start routing application input through @p filter
   */
  virtual void install(QObject *filter) = 0;

  /**
   * @brief Stop routing application input through @p filter
   */
  virtual void remove(QObject *filter) = 0;
};

/**
 * @brief InputHook backed by QCoreApplication::installEventFilter()
 */
class ApplicationInputHook : public InputHook {
public:
  void install(QObject *filter) override;
  void remove(QObject *filter) override;
};

/**
 * @brief Verdict of the gate for a single press
 */
enum class GateDecision { Allow, Suppress };

/**
 * @brief Press filter restricting interaction to the spotlighted widget
 *
 * Bounds are read live from the widgets at press time. A widget that has
 * been destroyed counts as not registered.
 */
class InputGate : public QObject {
  Q_OBJECT

public:
  explicit InputGate(QObject *parent = nullptr);
  ~InputGate() override = default;

  void setTarget(QWidget *target);
  void setCoachmark(QWidget *coachmark);

  /**
   * @brief Forget the target and the coachmark (gate becomes fail-open)
   */
  void clear();

  [[nodiscard]] QWidget *target() const { return m_target; }
  [[nodiscard]] QWidget *coachmark() const { return m_coachmark; }

  /**
   * @brief Decide a press at global position @p pos
   *
   * Rules, in order: without a target or a coachmark allow; inside the
   * coachmark allow; inside the target allow; otherwise suppress.
   */
  [[nodiscard]] static GateDecision
  evaluatePress(const std::optional<QRect> &targetRect,
                const std::optional<QRect> &coachmarkRect, const QPoint &pos);

  /**
   * @brief Decide a press against the currently registered widgets
   */
  [[nodiscard]] GateDecision evaluate(const QPoint &globalPos) const;

  [[nodiscard]] int allowedCount() const { return m_allowed; }
  [[nodiscard]] int suppressedCount() const { return m_suppressed; }

  bool eventFilter(QObject *watched, QEvent *event) override;

private:
  QPointer<QWidget> m_target;
  QPointer<QWidget> m_coachmark;

  int m_allowed = 0;
  int m_suppressed = 0;
};

} // namespace QtTour
