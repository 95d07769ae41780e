/**
 * @file test_tour_step.cpp
 * @brief Unit tests for TourStep and TourSequence
 */

#include <catch2/catch_test_macros.hpp>
#include "QtTour/tour_step.hpp"
#include <QCoreApplication>
#include <QPointer>
#include <QPushButton>

using namespace QtTour;

TEST_CASE("TourStep defaults", "[tour_step]") {
  QPushButton button("Target");

  SECTION("only a target") {
    TourStep step(&button);
    REQUIRE(step.target() == &button);
    REQUIRE(step.message().isEmpty());
    REQUIRE(step.action().isEmpty());
    REQUIRE(step.delegateClick());
  }

  SECTION("all fields") {
    TourStep step(&button, "Click here", "Next", false);
    REQUIRE(step.message() == "Click here");
    REQUIRE(step.action() == "Next");
    REQUIRE_FALSE(step.delegateClick());
  }

  SECTION("target is not owned and may go away") {
    auto *target = new QPushButton("Short lived");
    TourStep step(target);
    delete target;
    REQUIRE(step.target() == nullptr);
  }
}

TEST_CASE("TourSequence keeps insertion order", "[tour_sequence]") {
  QPushButton a("A");
  QPushButton b("B");
  TourSequence sequence;
  REQUIRE(sequence.isEmpty());

  auto *first = new TourStep(&a);
  auto *second = new TourStep(&b);
  auto *third = new TourStep(&a);

  SECTION("addStep appends") {
    sequence.addStep(first);
    sequence.addStep(second);
    REQUIRE(sequence.size() == 2);
    REQUIRE(sequence.steps()[0] == first);
    REQUIRE(sequence.steps()[1] == second);
    delete third;
  }

  SECTION("addSteps appends a batch in order, duplicates allowed") {
    sequence.addStep(first);
    sequence.addSteps({second, third});
    REQUIRE(sequence.size() == 3);
    REQUIRE(sequence.stepAt(1) == second);
    REQUIRE(sequence.stepAt(2) == third);
    REQUIRE(sequence.stepAt(0)->target() == sequence.stepAt(2)->target());
  }

  SECTION("stepAt is range checked") {
    sequence.addSteps({first, second, third});
    REQUIRE(sequence.stepAt(-1) == nullptr);
    REQUIRE(sequence.stepAt(3) == nullptr);
  }
}

TEST_CASE("TourSequence ownership and notifications", "[tour_sequence]") {
  QPushButton a("A");
  TourSequence sequence;

  int added = 0;
  int lastIndex = -1;
  QObject::connect(&sequence, &TourSequence::stepAdded, [&](int index) {
    ++added;
    lastIndex = index;
  });

  SECTION("parentless steps are adopted") {
    auto *step = new TourStep(&a);
    sequence.addStep(step);
    REQUIRE(step->parent() == &sequence);
    REQUIRE(added == 1);
    REQUIRE(lastIndex == 0);
  }

  SECTION("steps with an owner keep it") {
    QObject owner;
    auto *step = new TourStep(&a, QString(), QString(), true, &owner);
    sequence.addStep(step);
    REQUIRE(step->parent() == &owner);
  }

  SECTION("null steps are ignored") {
    sequence.addStep(nullptr);
    REQUIRE(sequence.isEmpty());
    REQUIRE(added == 0);
  }

  SECTION("clear empties and deletes adopted steps") {
    QObject owner;
    QPointer<TourStep> adopted = new TourStep(&a);
    QPointer<TourStep> owned = new TourStep(&a, QString(), QString(), true,
                                            &owner);
    sequence.addSteps({adopted, owned, adopted});

    sequence.clear();
    QCoreApplication::sendPostedEvents(nullptr, QEvent::DeferredDelete);

    REQUIRE(sequence.isEmpty());
    REQUIRE(adopted.isNull());
    REQUIRE_FALSE(owned.isNull());
  }
}

TEST_CASE("TourSequence sees steps destroyed by their owner as null",
          "[tour_sequence]") {
  QPushButton a("A");
  TourSequence sequence;
  auto *owner = new QObject;
  auto *kept = new TourStep(&a);
  auto *doomed = new TourStep(&a, QString(), QString(), true, owner);
  sequence.addSteps({kept, doomed});

  delete owner;

  REQUIRE(sequence.size() == 2);
  REQUIRE(sequence.stepAt(0) == kept);
  REQUIRE(sequence.stepAt(1) == nullptr);
  REQUIRE(sequence.steps()[1].isNull());

  sequence.clear();
  REQUIRE(sequence.isEmpty());
}
