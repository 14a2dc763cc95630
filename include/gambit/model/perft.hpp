#pragma once
#include <cstdint>
#include <utility>
#include <vector>

#include "move.hpp"
#include "position.hpp"

namespace gambit::model {

std::uint64_t perft(const Position& pos, int depth);

// Per-move breakdown at root
void perftDivide(const Position& pos, int depth,
                 std::vector<std::pair<Move, std::uint64_t>>& out);

}  // namespace gambit::model
