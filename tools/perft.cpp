#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "gambit/constants.hpp"
#include "gambit/model/fen.hpp"
#include "gambit/model/perft.hpp"

using namespace gambit;

namespace {

struct Options {
  std::string fen = core::START_FEN;
  int depth = 3;
  bool divide = false;
};

[[noreturn]] void usage_and_exit(int code) {
  std::cerr << "Usage: gambit_perft [--fen <FEN>] [--depth <N>] [--divide]\n"
               "Options:\n"
               "  --fen <FEN>   Root position (default: standard start)\n"
               "  --depth <N>   Plies to expand (default 3)\n"
               "  --divide      Print the node count below every root move\n"
               "  --help        Show this message\n";
  std::exit(code);
}

Options parse_args(int argc, char** argv) {
  Options o;
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
      o.fen = require_value(i, "--fen");
    } else if (arg == "--depth") {
      const std::string v = require_value(i, "--depth");
      try {
        o.depth = std::stoi(v);
      } catch (const std::logic_error&) {
        std::cerr << "Invalid value for --depth: " << v << "\n";
        usage_and_exit(1);
      }
      if (o.depth < 0) {
        std::cerr << "Depth must not be negative\n";
        usage_and_exit(1);
      }
    } else if (arg == "--divide") {
      o.divide = true;
    } else if (arg == "--help" || arg == "-h") {
      usage_and_exit(0);
    } else {
      std::cerr << "Unknown option: " << arg << "\n";
      usage_and_exit(1);
    }
  }
  return o;
}

}  // namespace

int main(int argc, char** argv) {
  const Options o = parse_args(argc, argv);

  model::Position root;
  try {
    root = model::fen::parse(o.fen);
  } catch (const std::runtime_error& e) {
    std::cerr << "[Perft] " << e.what() << "\n";
    return 1;
  }

  const auto t0 = std::chrono::steady_clock::now();
  std::uint64_t total = 0;
  if (o.divide) {
    std::vector<std::pair<model::Move, std::uint64_t>> parts;
    model::perftDivide(root, o.depth, parts);
    for (const auto& [m, n] : parts) {
      std::cout << m.toString() << " " << n << "\n";
      total += n;
    }
    if (o.depth == 0) total = 1;
  } else {
    total = model::perft(root, o.depth);
  }
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      std::chrono::steady_clock::now() - t0)
                      .count();

  std::cout << "total " << total << "\n";
  std::cerr << "[Perft] depth " << o.depth << " in " << ms << " ms\n";
  return 0;
}
