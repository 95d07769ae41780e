/**
 * @file input_gate.cpp
 * @brief Implementation of the tour input gate
 */

#include "QtTour/input_gate.hpp"
#include "QtTour/tour_geometry.hpp"
#include <QApplication>
#include <QDebug>
#include <QMouseEvent>
#include <QWindow>

namespace QtTour {

namespace {
// Presses on the active modal dialog (e.g. the cancel prompt) always pass
bool belongsToActiveModal(QObject *watched) {
  QWidget *modal = QApplication::activeModalWidget();
  if (!modal || !watched) {
    return false;
  }
  if (auto *widget = qobject_cast<QWidget *>(watched)) {
    return widget->window() == modal;
  }
  if (auto *window = qobject_cast<QWindow *>(watched)) {
    return window == modal->windowHandle();
  }
  return false;
}
} // namespace

// ============================================================================
// ApplicationInputHook
// ============================================================================

void ApplicationInputHook::install(QObject *filter) {
  if (auto *app = QCoreApplication::instance()) {
    app->installEventFilter(filter);
  } else {
    qWarning() << "Cannot install tour input gate without an application";
  }
}

void ApplicationInputHook::remove(QObject *filter) {
  if (auto *app = QCoreApplication::instance()) {
    app->removeEventFilter(filter);
  }
}

// ============================================================================
// InputGate
// ============================================================================

InputGate::InputGate(QObject *parent) : QObject(parent) {}

void InputGate::setTarget(QWidget *target) { m_target = target; }

void InputGate::setCoachmark(QWidget *coachmark) { m_coachmark = coachmark; }

void InputGate::clear() {
  m_target = nullptr;
  m_coachmark = nullptr;
}

GateDecision InputGate::evaluatePress(const std::optional<QRect> &targetRect,
                                      const std::optional<QRect> &coachmarkRect,
                                      const QPoint &pos) {
  // Fail open until both widgets are registered
  if (!targetRect.has_value() || !coachmarkRect.has_value()) {
    return GateDecision::Allow;
  }
  if (coachmarkRect->contains(pos)) {
    return GateDecision::Allow;
  }
  if (targetRect->contains(pos)) {
    return GateDecision::Allow;
  }
  return GateDecision::Suppress;
}

GateDecision InputGate::evaluate(const QPoint &globalPos) const {
  std::optional<QRect> targetRect;
  std::optional<QRect> coachmarkRect;
  if (m_target) {
    targetRect = geometry::globalRect(m_target);
  }
  if (m_coachmark) {
    coachmarkRect = geometry::globalRect(m_coachmark);
  }
  return evaluatePress(targetRect, coachmarkRect, globalPos);
}

bool InputGate::eventFilter(QObject *watched, QEvent *event) {
  const QEvent::Type type = event->type();
  if (type != QEvent::MouseButtonPress &&
      type != QEvent::MouseButtonDblClick) {
    return QObject::eventFilter(watched, event);
  }

  auto *mouseEvent = static_cast<QMouseEvent *>(event);
  if (belongsToActiveModal(watched) ||
      evaluate(mouseEvent->globalPosition().toPoint()) ==
      GateDecision::Allow) {
    ++m_allowed;
    return false;
  }

  ++m_suppressed;
  return true;
}

} // namespace QtTour
