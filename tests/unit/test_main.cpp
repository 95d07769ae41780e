/**
 * @file test_main.cpp
 * @brief Catch2 entry point running the tests inside a QApplication
 */

#include <catch2/catch_session.hpp>
#include <QApplication>

int main(int argc, char *argv[]) {
  // Widgets are created and shown, but never on a real display
  if (qEnvironmentVariableIsEmpty("QT_QPA_PLATFORM")) {
    qputenv("QT_QPA_PLATFORM", "offscreen");
  }

  QApplication app(argc, argv);
  return Catch::Session().run(argc, argv);
}
