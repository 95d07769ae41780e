#pragma once

/**
 * @file tour_step.hpp
 * @brief Tour steps and the ordered sequence that holds them
 */

#include <QObject>
#include <QPointer>
#include <QString>
#include <QWidget>
#include <initializer_list>
#include <vector>

namespace QtTour {

/**
 * @brief One stop of a tour
 *
 * A step refers to a widget it does not own. The widget must outlive the
 * step's activation; if it is destroyed earlier target() returns null and
 * the manager skips the step.
 */
class TourStep : public QObject {
  Q_OBJECT

public:
  /**
   * @brief Construct a step
   * @param target Widget to spotlight
   * @param message Bubble text (empty = no bubble)
   * @param action Action button label (empty = no button)
   * @param delegateClick Press the target when the step is confirmed
   * @param parent Owner; TourSequence adopts parentless steps
   */
  explicit TourStep(QWidget *target, const QString &message = QString(),
                    const QString &action = QString(),
                    bool delegateClick = true, QObject *parent = nullptr);
  ~TourStep() override = default;

  [[nodiscard]] QWidget *target() const { return m_target; }
  [[nodiscard]] const QString &message() const { return m_message; }
  [[nodiscard]] const QString &action() const { return m_action; }
  [[nodiscard]] bool delegateClick() const { return m_delegateClick; }

signals:
  /**
   * @brief Emitted when the manager advances past this step
   */
  void finished();

private:
  QPointer<QWidget> m_target;
  QString m_message;
  QString m_action;
  bool m_delegateClick = true;
};

/**
 * @brief Ordered list of steps; insertion order is activation order
 *
 * The same widget may appear in several steps. The sequence is owned by
 * the caller and read by TourManager for the duration of a run. Clearing a
 * sequence that is being run is the caller's responsibility; the manager
 * only guards its index against it.
 */
class TourSequence : public QObject {
  Q_OBJECT

public:
  explicit TourSequence(QObject *parent = nullptr);
  ~TourSequence() override = default;

  /**
   * @brief Append a step
   *
   * Steps without a parent are adopted by the sequence.
   */
  void addStep(TourStep *step);

  /**
   * @brief Append several steps in the given order
   */
  void addSteps(std::initializer_list<TourStep *> steps);

  /**
   * @brief Remove all steps; adopted steps are scheduled for deletion
   */
  void clear();

  /**
   * @brief Steps in order; a step destroyed elsewhere reads as null
   */
  [[nodiscard]] const std::vector<QPointer<TourStep>> &steps() const {
    return m_steps;
  }
  [[nodiscard]] int size() const { return static_cast<int>(m_steps.size()); }
  [[nodiscard]] bool isEmpty() const { return m_steps.empty(); }

  /**
   * @brief Step at @p index, or nullptr when out of range or destroyed
   */
  [[nodiscard]] TourStep *stepAt(int index) const;

signals:
  void stepAdded(int index);

private:
  std::vector<QPointer<TourStep>> m_steps;
};

} // namespace QtTour
