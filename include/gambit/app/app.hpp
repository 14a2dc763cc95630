#pragma once

#include <utility>

#include "app_config.hpp"

namespace gambit::app {

class App {
 public:
  explicit App(AppConfig config = {}) : m_config(std::move(config)) {}

  // Runs the window loop until it is closed. Returns the process exit code.
  int run();

 private:
  AppConfig m_config;
};

}  // namespace gambit::app
