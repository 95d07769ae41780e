/**
 * @file tour_manager.cpp
 * @brief Implementation of the tour manager
 */

#include "QtTour/tour_manager.hpp"
#include "QtTour/tour_geometry.hpp"
#include "QtTour/tour_mask.hpp"
#include <QAbstractButton>
#include <QCoreApplication>
#include <QDebug>
#include <QMessageBox>

namespace QtTour {

std::atomic<TourManager *> TourManager::s_instance{nullptr};
std::mutex TourManager::s_instanceMutex;

TourManager &TourManager::instance() {
  TourManager *manager = s_instance.load(std::memory_order_acquire);
  if (!manager) {
    std::lock_guard<std::mutex> lock(s_instanceMutex);
    manager = s_instance.load(std::memory_order_relaxed);
    if (!manager) {
      manager = new TourManager();
      // First use may come from a worker thread; the manager drives widgets
      if (auto *app = QCoreApplication::instance()) {
        if (manager->thread() != app->thread()) {
          manager->moveToThread(app->thread());
        }
      }
      s_instance.store(manager, std::memory_order_release);
    }
  }
  return *manager;
}

TourManager::TourManager(std::unique_ptr<InputHook> hook, QObject *parent)
    : QObject(parent), m_inputHook(std::move(hook)) {
  if (!m_inputHook) {
    m_inputHook = std::make_unique<ApplicationInputHook>();
  }
  m_inputGate = new InputGate(this);

  m_confirmCancel = [](QWidget *parent) {
    return QMessageBox::question(parent, tr("Exit Tour"),
                                 tr("Do you want to exit the tour?"),
                                 QMessageBox::Yes | QMessageBox::No) ==
           QMessageBox::Yes;
  };
}

TourManager::~TourManager() {
  if (m_gateInstalled) {
    m_inputHook->remove(m_inputGate);
    m_gateInstalled = false;
  }
  discardCoachmark();
  discardMask();

  TourManager *self = this;
  s_instance.compare_exchange_strong(self, nullptr);
}

void TourManager::setSettings(const TourSettings &settings) {
  m_settings = settings;
  if (!m_settings.coachColor.isValid()) {
    qWarning() << "Invalid tour coach color, using darkBlue";
    m_settings.coachColor = QColor(Qt::darkBlue);
  }
}

void TourManager::setCoachColor(const QColor &color) {
  if (!color.isValid()) {
    qWarning() << "Ignoring invalid tour coach color";
    return;
  }
  m_settings.coachColor = color;
}

bool TourManager::setCoachColor(const QString &name) {
  QColor color(name);
  if (!color.isValid()) {
    qWarning() << "Ignoring invalid tour coach color:" << name;
    return false;
  }
  m_settings.coachColor = color;
  return true;
}

void TourManager::setMaskEnabled(bool enabled) {
  m_settings.maskEnabled = enabled;
}

void TourManager::setCancelConfirmation(Coachmark::CancelConfirmation confirm) {
  m_confirmCancel = std::move(confirm);
}

void TourManager::run(TourSequence *sequence, bool finishOnComplete) {
  if (!sequence) {
    qWarning() << "Cannot run a tour without a sequence";
    return;
  }

  if (m_started) {
    qWarning() << "A tour is already running, restarting with a new sequence";
    finish();
    if (m_started) {
      qWarning() << "Tour was restarted while finishing, ignoring run()";
      return;
    }
  }

  m_sequence = sequence;
  m_finishOnComplete = finishOnComplete;
  m_stepIndex = 0;
  m_currentStep = nullptr;
  connect(sequence, &TourSequence::stepAdded, this,
          &TourManager::onStepAdded);

  const quint64 runId = m_runId + 1;
  start();
  if (runId != m_runId || !m_started) {
    return;
  }

  if (sequence->isEmpty()) {
    qDebug() << "Tour started with an empty sequence";
    return;
  }

  activateCurrentStep();
}

void TourManager::start() {
  m_started = true;
  ++m_runId;

  if (!m_gateInstalled) {
    m_inputHook->install(m_inputGate);
    m_gateInstalled = true;
  }

  qDebug() << "Tour started";
  emit tourStarted();
}

void TourManager::next() {
  if (!m_started || !m_coachmark || !m_currentStep || m_advancing) {
    return;
  }

  const quint64 runId = m_runId;
  QPointer<TourStep> step = m_currentStep;
  m_advancing = true;

  if (step->delegateClick()) {
    if (auto *button = qobject_cast<QAbstractButton *>(step->target())) {
      button->click();
    }
  }

  // The target's own handlers may have finished or restarted the tour
  if (runId == m_runId && step) {
    emit step->finished();
  }

  m_advancing = false;
  if (runId != m_runId) {
    return;
  }

  ++m_stepIndex;
  discardCoachmark();
  m_currentStep = nullptr;
  activateCurrentStep();
}

bool TourManager::resume() {
  if (!m_started || m_coachmark || m_advancing || !hasStepInRange()) {
    return false;
  }

  activateCurrentStep();
  return m_coachmark != nullptr;
}

void TourManager::finish() {
  if (!m_started) {
    return;
  }

  ++m_runId;

  if (m_gateInstalled) {
    m_inputHook->remove(m_inputGate);
    m_gateInstalled = false;
  }

  discardCoachmark();
  discardMask();

  if (m_sequence) {
    disconnect(m_sequence, nullptr, this, nullptr);
  }
  m_sequence = nullptr;
  m_currentStep = nullptr;
  m_stepIndex = 0;
  m_started = false;

  qDebug() << "Tour finished";
  emit tourFinished();
}

void TourManager::onStepAdded(int index) {
  Q_UNUSED(index)

  if (m_started && !m_coachmark && !m_advancing) {
    resume();
  }
}

void TourManager::activateCurrentStep() {
  while (hasStepInRange()) {
    TourStep *step = m_sequence->stepAt(m_stepIndex);
    if (!step) {
      qWarning() << "Skipping tour step" << m_stepIndex
                 << "that no longer exists";
    } else if (!step->target()) {
      qWarning() << "Skipping tour step" << m_stepIndex
                 << "whose target widget no longer exists";
    } else {
      activate(step);
      return;
    }
    ++m_stepIndex;
  }

  onSequenceExhausted();
}

void TourManager::activate(TourStep *step) {
  QWidget *target = step->target();
  m_currentStep = step;
  m_inputGate->setTarget(target);

  auto *mark = new Coachmark(target, m_settings, step->message(),
                             step->action(), target->window());
  if (m_settings.confirmCancel) {
    mark->setCancelConfirmation(m_confirmCancel);
  }
  connect(mark, &Coachmark::activated, this, &TourManager::next);
  connect(mark, &Coachmark::cancelRequested, this, &TourManager::finish);
  m_coachmark = mark;

  if (m_settings.maskEnabled) {
    updateMask(target);
  } else {
    discardMask();
  }

  m_inputGate->setCoachmark(mark);
  mark->show();

  qDebug() << "Tour step" << m_stepIndex << "activated";
  emit stepActivated(m_stepIndex);
}

void TourManager::onSequenceExhausted() {
  if (m_finishOnComplete) {
    finish();
    return;
  }

  if (!m_sequence) {
    qWarning() << "Tour sequence was destroyed while the tour was running";
    return;
  }

  qDebug() << "Tour waiting for more steps at index" << m_stepIndex;
}

void TourManager::updateMask(QWidget *target) {
  QWidget *window = target->window();

  if (!m_overlayMask) {
    m_overlayMask =
        new TourMask(window, m_settings.coachColor, m_settings.maskOpacity);
  } else {
    m_overlayMask->setColor(m_settings.coachColor, m_settings.maskOpacity);
  }

  m_overlayMask->attachTo(window);
  m_overlayMask->setCutout(geometry::globalRect(target));
}

void TourManager::discardCoachmark() {
  m_inputGate->clear();

  if (!m_coachmark) {
    return;
  }

  // Deleted later: the coachmark may be emitting the signal that got us here
  Coachmark *mark = m_coachmark;
  m_coachmark = nullptr;
  mark->disconnect(this);
  mark->dismiss();
  mark->deleteLater();
}

void TourManager::discardMask() {
  if (!m_overlayMask) {
    return;
  }

  TourMask *mask = m_overlayMask;
  m_overlayMask = nullptr;
  mask->hide();
  mask->deleteLater();
}

bool TourManager::hasStepInRange() const {
  return m_sequence && m_stepIndex >= 0 && m_stepIndex < m_sequence->size();
}

} // namespace QtTour
