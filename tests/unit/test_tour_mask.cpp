/**
 * @file test_tour_mask.cpp
 * @brief Unit tests for the dimming mask
 */

#include <catch2/catch_test_macros.hpp>
#include "QtTour/tour_geometry.hpp"
#include "QtTour/tour_mask.hpp"
#include <QPushButton>
#include <QWidget>

using namespace QtTour;

TEST_CASE("TourMask covers its window", "[tour_mask]") {
  QWidget window;
  window.setGeometry(100, 100, 400, 300);
  auto *button = new QPushButton("Target", &window);
  button->setGeometry(40, 50, 80, 30);
  window.show();

  auto *mask = new TourMask(&window);
  mask->attachTo(&window);

  SECTION("fills the window and ignores the mouse") {
    REQUIRE(mask->geometry() == window.rect());
    REQUIRE(mask->isVisible());
    REQUIRE(mask->testAttribute(Qt::WA_TransparentForMouseEvents));
  }

  SECTION("cutout is mapped from global coordinates") {
    mask->setCutout(geometry::globalRect(button));
    REQUIRE(mask->cutout() == button->geometry());
    REQUIRE_FALSE(mask->maskedRegion().contains(button->geometry().center()));
    REQUIRE(mask->maskedRegion().contains(QPoint(5, 5)));
  }

  SECTION("follows resizes of its host and keeps the cutout") {
    auto *panel = new QWidget(&window);
    panel->setGeometry(0, 0, 200, 150);
    panel->show();
    mask->attachTo(panel);
    mask->setCutout(geometry::globalRect(button));
    const QRect cutout = mask->cutout();

    panel->resize(300, 250);
    REQUIRE(mask->geometry() == QRect(0, 0, 300, 250));
    REQUIRE(mask->cutout() == cutout);
  }

  SECTION("moves to another window") {
    QWidget other;
    other.setGeometry(0, 0, 200, 200);
    other.show();
    mask->attachTo(&other);
    REQUIRE(mask->parentWidget() == &other);
    REQUIRE(mask->geometry() == other.rect());
    delete mask;
  }
}
