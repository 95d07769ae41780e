#pragma once

/**
 * @file tour_manager.hpp
 * @brief Orchestrator of guided tours
 *
 * Drives one tour at a time:
 * - Installs the input gate for the duration of a run
 * - Activates steps by creating a coachmark (and optional mask) over the
 *   step's target
 * - Advances on coachmark activation, pressing the target when the step
 *   delegates its click
 * - Tears everything down when the tour finishes or is cancelled
 */

#include "coachmark.hpp"
#include "input_gate.hpp"
#include "tour_step.hpp"
#include "tour_types.hpp"
#include <QObject>
#include <QPointer>
#include <QString>
#include <atomic>
#include <memory>
#include <mutex>

namespace QtTour {

class TourMask;

/**
 * @brief Tour state machine (Idle -> Running -> Idle)
 *
 * Usage:
 * @code
 * auto *sequence = new TourSequence(this);
 * sequence->addSteps({new TourStep(openButton),
 *                     new TourStep(saveButton, tr("Save your work"))});
 * TourManager::instance().run(sequence);
 * @endcode
 *
 * A manager can also be constructed directly (e.g. by an application's
 * composition root or a test) with its own InputHook.
 *
 * All methods must be called from the GUI thread, except instance() which
 * may be called from any thread.
 */
class TourManager : public QObject {
  Q_OBJECT

public:
  /**
   * @brief Construct a manager
   * @param hook Input hook used to install the gate; defaults to
   *        ApplicationInputHook
   */
  explicit TourManager(std::unique_ptr<InputHook> hook = nullptr,
                       QObject *parent = nullptr);
  ~TourManager() override;

  TourManager(const TourManager &) = delete;
  TourManager &operator=(const TourManager &) = delete;

  /**
   * @brief Get the process-wide instance, creating it on first use
   */
  static TourManager &instance();

  // =========================================================================
  // Configuration
  // =========================================================================

  void setSettings(const TourSettings &settings);
  [[nodiscard]] const TourSettings &settings() const { return m_settings; }

  /**
   * @brief Set the highlight/mask color for subsequently activated steps
   */
  void setCoachColor(const QColor &color);

  /**
   * @brief Set the color by name (e.g. "darkBlue", "#336699")
   * @return false if the name is not a valid color
   */
  bool setCoachColor(const QString &name);
  bool setCoachColor(const char *name) {
    return setCoachColor(QString::fromUtf8(name));
  }

  [[nodiscard]] QColor coachColor() const { return m_settings.coachColor; }

  void setMaskEnabled(bool enabled);

  /**
   * @brief Replace the prompt asked before escape cancels the tour
   *
   * The default asks with a Yes/No message box.
   */
  void setCancelConfirmation(Coachmark::CancelConfirmation confirm);

  // =========================================================================
  // Tour lifecycle
  // =========================================================================

  /**
   * @brief Start a tour over @p sequence
   * @param finishOnComplete Finish automatically after the last step. When
   *        false the tour stays running and resumes as soon as a step is
   *        appended to the sequence.
   *
   * A running tour is finished first; if a tourFinished() handler starts
   * another tour meanwhile, this call is dropped. An empty sequence leaves
   * the tour running with no active step.
   */
  void run(TourSequence *sequence, bool finishOnComplete = true);

  /**
   * @brief Advance past the current step
   */
  void next();

  /**
   * @brief Activate the step at the current index if none is active
   * @return true if a step was activated
   */
  bool resume();

  /**
   * @brief End the tour; no-op when idle
   */
  void finish();

  [[nodiscard]] TourState state() const {
    return m_started ? TourState::Running : TourState::Idle;
  }
  [[nodiscard]] bool isRunning() const { return m_started; }
  [[nodiscard]] int currentStepIndex() const { return m_stepIndex; }
  [[nodiscard]] TourStep *currentStep() const { return m_currentStep; }
  [[nodiscard]] TourSequence *sequence() const { return m_sequence; }
  [[nodiscard]] Coachmark *coachmark() const { return m_coachmark; }
  [[nodiscard]] TourMask *overlayMask() const { return m_overlayMask; }
  [[nodiscard]] InputGate *inputGate() const { return m_inputGate; }

signals:
  void tourStarted();
  void tourFinished();

  /**
   * @brief Emitted after the step at @p index became active
   */
  void stepActivated(int index);

private slots:
  void onStepAdded(int index);

private:
  void start();
  void activateCurrentStep();
  void activate(TourStep *step);
  void onSequenceExhausted();
  void updateMask(QWidget *target);
  void discardCoachmark();
  void discardMask();
  [[nodiscard]] bool hasStepInRange() const;

  TourSettings m_settings;
  Coachmark::CancelConfirmation m_confirmCancel;

  bool m_started = false;
  bool m_finishOnComplete = true;
  int m_stepIndex = 0;
  quint64 m_runId = 0;

  QPointer<TourSequence> m_sequence;
  QPointer<TourStep> m_currentStep;
  QPointer<Coachmark> m_coachmark;
  QPointer<TourMask> m_overlayMask;

  InputGate *m_inputGate = nullptr;
  std::unique_ptr<InputHook> m_inputHook;
  bool m_gateInstalled = false;
  bool m_advancing = false;

  static std::atomic<TourManager *> s_instance;
  static std::mutex s_instanceMutex;
};

} // namespace QtTour
