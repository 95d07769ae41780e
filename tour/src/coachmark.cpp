/**
 * @file coachmark.cpp
 * @brief Implementation of the coachmark window
 */

#include "QtTour/coachmark.hpp"
#include <QCloseEvent>
#include <QFrame>
#include <QGraphicsDropShadowEffect>
#include <QKeyEvent>
#include <QLabel>
#include <QMouseEvent>
#include <QPainter>
#include <QPainterPath>
#include <QPointer>
#include <QPropertyAnimation>
#include <QPushButton>
#include <QScreen>
#include <QVBoxLayout>

namespace QtTour {

Coachmark::Coachmark(QWidget *target, const TourSettings &settings,
                     const QString &message, const QString &action,
                     QWidget *parent)
    : QWidget(parent), m_color(settings.coachColor) {
  setWindowFlags(Qt::Tool | Qt::FramelessWindowHint |
                 Qt::WindowStaysOnTopHint);
  setAttribute(Qt::WA_TranslucentBackground);
  setFocusPolicy(Qt::StrongFocus);
  setCursor(Qt::PointingHandCursor);

  setupUI(message, action);
  layoutAround(target, settings.padding);

  // Looping glow on the border
  m_glowEffect = new QGraphicsDropShadowEffect(m_frame);
  m_glowEffect->setOffset(0, 0);
  m_glowEffect->setColor(m_color.darker());
  m_glowEffect->setBlurRadius(0);
  m_frame->setGraphicsEffect(m_glowEffect);

  m_glowAnimation = new QPropertyAnimation(m_glowEffect, "blurRadius", this);
  m_glowAnimation->setDuration(settings.glowDurationMs);
  m_glowAnimation->setStartValue(0.0);
  m_glowAnimation->setKeyValueAt(0.5, static_cast<qreal>(settings.glowRadius));
  m_glowAnimation->setEndValue(0.0);
  m_glowAnimation->setLoopCount(-1);
}

Coachmark::~Coachmark() {
  if (m_glowAnimation) {
    m_glowAnimation->stop();
  }
}

void Coachmark::setupUI(const QString &message, const QString &action) {
  m_frame = new QFrame(this);
  m_frame->setAttribute(Qt::WA_TransparentForMouseEvents);
  m_frame->setStyleSheet(
      QString("QFrame { border: %1px dashed %2; border-radius: %3px; }")
          .arg(BORDER_WIDTH)
          .arg(m_color.name())
          .arg(BORDER_RADIUS));

  if (message.isEmpty()) {
    return;
  }

  m_bubble = new QFrame(this);
  m_bubble->setFixedWidth(BUBBLE_WIDTH);
  m_bubble->setObjectName("coachmarkBubble");
  m_bubble->setStyleSheet(
      QString("QFrame#coachmarkBubble { background: palette(base); border: "
              "1px solid %1; border-radius: 6px; }")
          .arg(m_color.name()));

  auto *layout = new QVBoxLayout(m_bubble);
  layout->setContentsMargins(12, 10, 12, 10);
  layout->setSpacing(8);

  m_messageLabel = new QLabel(message, m_bubble);
  m_messageLabel->setWordWrap(true);
  layout->addWidget(m_messageLabel);

  if (!action.isEmpty()) {
    m_actionButton = new QPushButton(action, m_bubble);
    m_actionButton->setCursor(Qt::PointingHandCursor);
    m_actionButton->setStyleSheet(
        QString("QPushButton { background: %1; color: white; border: none; "
                "border-radius: 4px; padding: 4px 12px; }"
                "QPushButton:hover { background: %2; }")
            .arg(m_color.name())
            .arg(m_color.lighter(130).name()));
    connect(m_actionButton, &QPushButton::clicked, this,
            &Coachmark::activated);
    layout->addWidget(m_actionButton, 0, Qt::AlignRight);
  }
}

void Coachmark::layoutAround(QWidget *target, int padding) {
  m_highlightRect =
      geometry::highlightRect(geometry::globalRect(target), padding);

  QRect frameRect = m_highlightRect;
  if (m_bubble) {
    QLayout *layout = m_bubble->layout();
    const int height = layout->hasHeightForWidth()
                           ? layout->totalHeightForWidth(BUBBLE_WIDTH)
                           : m_bubble->sizeHint().height();

    QRect bounds;
    if (target && target->screen()) {
      bounds = target->screen()->availableGeometry();
    }

    const geometry::BubbleLayout bubble = geometry::placeBubble(
        m_highlightRect, QSize(BUBBLE_WIDTH, height), bounds);
    m_bubbleRect = bubble.rect;
    m_placement = bubble.placement;
    m_arrow = bubble.arrow;
    frameRect = frameRect.united(m_bubbleRect);
  } else {
    m_pointerRect = geometry::pointerRect(m_highlightRect);
    frameRect = frameRect.united(m_pointerRect);
  }

  setGeometry(frameRect);
  m_frame->setGeometry(toLocal(m_highlightRect));
  if (m_bubble) {
    m_bubble->setGeometry(toLocal(m_bubbleRect));
  }
}

QRect Coachmark::toLocal(const QRect &globalRect) const {
  return globalRect.translated(-geometry().topLeft());
}

bool Coachmark::isAnimating() const {
  return m_glowAnimation &&
         m_glowAnimation->state() == QAbstractAnimation::Running;
}

void Coachmark::setCancelConfirmation(CancelConfirmation confirm) {
  m_confirmCancel = std::move(confirm);
}

void Coachmark::requestCancel() {
  if (m_confirming) {
    return;
  }

  if (m_confirmCancel) {
    QPointer<Coachmark> self(this);
    m_confirming = true;
    const bool confirmed = m_confirmCancel(this);
    if (!self) {
      return;
    }
    m_confirming = false;
    if (!confirmed) {
      return;
    }
  }
  emit cancelRequested();
}

void Coachmark::dismiss() {
  m_closeSanctioned = true;
  close();
}

void Coachmark::paintEvent(QPaintEvent *event) {
  Q_UNUSED(event)

  QPainter painter(this);
  painter.setRenderHint(QPainter::Antialiasing);
  painter.setPen(Qt::NoPen);
  painter.setBrush(m_color);

  const QPoint origin = geometry().topLeft();

  if (!m_arrow.isEmpty()) {
    painter.drawPolygon(m_arrow.translated(-origin));
  }

  if (m_pointerRect.isValid()) {
    // Cursor-shaped glyph, designed on a 24x24 grid
    const QRect glyph = toLocal(m_pointerRect);
    const qreal sx = glyph.width() / 24.0;
    const qreal sy = glyph.height() / 24.0;
    QPainterPath path;
    path.moveTo(glyph.left() + 4 * sx, glyph.top() + 2 * sy);
    path.lineTo(glyph.left() + 4 * sx, glyph.top() + 20 * sy);
    path.lineTo(glyph.left() + 9 * sx, glyph.top() + 15 * sy);
    path.lineTo(glyph.left() + 13 * sx, glyph.top() + 22 * sy);
    path.lineTo(glyph.left() + 16 * sx, glyph.top() + 20 * sy);
    path.lineTo(glyph.left() + 12 * sx, glyph.top() + 14 * sy);
    path.lineTo(glyph.left() + 19 * sx, glyph.top() + 14 * sy);
    path.closeSubpath();
    painter.setPen(QPen(Qt::white, 1));
    painter.drawPath(path);
  }
}

void Coachmark::mousePressEvent(QMouseEvent *event) {
  m_pressedInside =
      toLocal(m_highlightRect).contains(event->position().toPoint());
  event->accept();
}

void Coachmark::mouseReleaseEvent(QMouseEvent *event) {
  const bool inside =
      toLocal(m_highlightRect).contains(event->position().toPoint());
  const bool wasPressedInside = m_pressedInside;
  m_pressedInside = false;
  event->accept();

  if (inside && wasPressedInside) {
    emit activated();
  }
}

void Coachmark::keyPressEvent(QKeyEvent *event) {
  event->accept();
  if (event->key() == Qt::Key_Escape) {
    requestCancel();
  }
}

void Coachmark::showEvent(QShowEvent *event) {
  QWidget::showEvent(event);
  m_glowAnimation->start();
  activateWindow();
  setFocus(Qt::ActiveWindowFocusReason);
}

void Coachmark::hideEvent(QHideEvent *event) {
  m_glowAnimation->stop();
  QWidget::hideEvent(event);
}

void Coachmark::closeEvent(QCloseEvent *event) {
  if (!m_closeSanctioned) {
    event->ignore();
    return;
  }
  QWidget::closeEvent(event);
}

} // namespace QtTour
