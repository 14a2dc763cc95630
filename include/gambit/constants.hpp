#pragma once

#include <string>

namespace gambit::core {
const std::string START_FEN = "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1";
enum GameResult { INITIAL, ONGOING, CHECKMATE, STALEMATE };
}  // namespace gambit::core
