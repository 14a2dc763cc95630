#include "gambit/app/app.hpp"
#include "gambit/app/app_config.hpp"

int main(int argc, char** argv) {
  gambit::app::App app(gambit::app::parseArgs(argc, argv));
  return app.run();
}
