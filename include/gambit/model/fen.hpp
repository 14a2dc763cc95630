#pragma once

#include <string>

#include "position.hpp"

namespace gambit::model::fen {

// Structural check of the six FEN fields (board layout, side to move, castling
// rights, en-passant square, halfmove and fullmove counters).
bool isFenWellFormed(const std::string& fen);

// Throws std::runtime_error if the string is not well formed.
Position parse(const std::string& fen);

std::string serialize(const Position& pos);

}  // namespace gambit::model::fen
