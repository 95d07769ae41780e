/**
 * @file tour_step.cpp
 * @brief Implementation of TourStep and TourSequence
 */

#include "QtTour/tour_step.hpp"
#include <QDebug>

namespace QtTour {

TourStep::TourStep(QWidget *target, const QString &message,
                   const QString &action, bool delegateClick, QObject *parent)
    : QObject(parent), m_target(target), m_message(message), m_action(action),
      m_delegateClick(delegateClick) {}

TourSequence::TourSequence(QObject *parent) : QObject(parent) {}

void TourSequence::addStep(TourStep *step) {
  if (!step) {
    qWarning() << "Ignoring null tour step";
    return;
  }

  if (!step->parent()) {
    step->setParent(this);
  }

  m_steps.push_back(step);
  emit stepAdded(size() - 1);
}

void TourSequence::addSteps(std::initializer_list<TourStep *> steps) {
  for (TourStep *step : steps) {
    addStep(step);
  }
}

void TourSequence::clear() {
  // A step may be listed more than once; delete each adopted one once
  for (const QPointer<TourStep> &step : m_steps) {
    if (step && step->parent() == this) {
      step->setParent(nullptr);
      step->deleteLater();
    }
  }
  m_steps.clear();
}

TourStep *TourSequence::stepAt(int index) const {
  if (index < 0 || index >= size()) {
    return nullptr;
  }
  return m_steps[static_cast<size_t>(index)];
}

} // namespace QtTour
