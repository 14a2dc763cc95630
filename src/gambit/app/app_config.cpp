#include "gambit/app/app_config.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>

#include "gambit/model/fen.hpp"

namespace gambit::app {

namespace {

[[noreturn]] void usage_and_exit(int code) {
  std::cerr << "Usage: gambit [options]\n"
               "Options:\n"
               "  --fen <FEN>      Start from this position (default: standard start)\n"
               "  --font <path>    TrueType font with chess glyphs (default "
            << view::constant::STR_FILE_PATH_FONT
            << ")\n"
               "  --flipped        Draw the board with Black at the bottom\n"
               "  --size <px>      Board edge length in pixels (default 640)\n"
               "  --help           Show this message\n";
  std::exit(code);
}

}  // namespace

AppConfig parseArgs(int argc, char** argv) {
  AppConfig cfg;

  auto require_value = [&](int& i, const char* name) -> std::string {
    if (i + 1 >= argc) {
      std::cerr << "Missing value for " << name << "\n";
      usage_and_exit(1);
    }
    return argv[++i];
  };

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--fen") {
      cfg.startFen = require_value(i, "--fen");
      if (!model::fen::isFenWellFormed(cfg.startFen)) {
        std::cerr << "Malformed FEN: " << cfg.startFen << "\n";
        usage_and_exit(1);
      }
    } else if (arg == "--font") {
      cfg.fontPath = require_value(i, "--font");
    } else if (arg == "--flipped") {
      cfg.flipped = true;
    } else if (arg == "--size") {
      const std::string v = require_value(i, "--size");
      try {
        const int px = std::stoi(v);
        if (px <= 0) throw std::out_of_range(v);
        cfg.boardPx = static_cast<unsigned int>(px);
      } catch (const std::logic_error&) {
        std::cerr << "Invalid value for --size: " << v << "\n";
        usage_and_exit(1);
      }
    } else if (arg == "--help" || arg == "-h") {
      usage_and_exit(0);
    } else {
      std::cerr << "Unknown option: " << arg << "\n";
      usage_and_exit(1);
    }
  }
  return cfg;
}

}  // namespace gambit::app
