/**
 * @file test_tour_types.cpp
 * @brief Unit tests for tour settings and enum helpers
 */

#include <catch2/catch_test_macros.hpp>
#include "QtTour/tour_types.hpp"

using namespace QtTour;

TEST_CASE("TourSettings defaults", "[tour_types]") {
  TourSettings settings;
  REQUIRE(settings.coachColor == QColor(Qt::darkBlue));
  REQUIRE(settings.padding == 10);
  REQUIRE_FALSE(settings.maskEnabled);
  REQUIRE(settings.maskOpacity == 0.45);
  REQUIRE(settings.glowRadius == 20);
  REQUIRE(settings.glowDurationMs == 600);
  REQUIRE(settings.confirmCancel);
}

TEST_CASE("enum string helpers", "[tour_types]") {
  REQUIRE(tourStateToString(TourState::Idle) == "idle");
  REQUIRE(tourStateToString(TourState::Running) == "running");
  REQUIRE(placementToString(BubblePlacement::None) == "none");
  REQUIRE(placementToString(BubblePlacement::Right) == "right");
  REQUIRE(placementToString(BubblePlacement::Left) == "left");
}
