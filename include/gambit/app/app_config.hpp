#pragma once

#include <string>

#include "../constants.hpp"
#include "../view/render_constants.hpp"

namespace gambit::app {

struct AppConfig {
  std::string startFen = core::START_FEN;
  std::string fontPath = view::constant::STR_FILE_PATH_FONT;
  bool flipped = false;
  unsigned int boardPx = 640;  // board edge length in pixels
};

// Reads the command line. Prints usage to stderr and exits on --help or on a
// bad option.
AppConfig parseArgs(int argc, char** argv);

}  // namespace gambit::app
