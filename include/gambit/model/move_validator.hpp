#pragma once

#include <vector>

#include "move.hpp"
#include "move_generator.hpp"
#include "position.hpp"

namespace gambit::model {

class MoveValidator {
 public:
  // Plays `move` on a copy of `pos` and checks that `side`'s king survives it.
  [[nodiscard]] bool isLegal(const Position& pos, const Move& move, core::Color side) const;

  // Legal moves from `from`; empty unless a piece of the side to move stands there.
  void legalMoves(const Position& pos, core::Square from, std::vector<Move>& out) const;

  // Every legal move of the side to move.
  void legalMoves(const Position& pos, std::vector<Move>& out) const;

  // Stops at the first legal move found.
  [[nodiscard]] bool hasAnyLegalMove(const Position& pos, core::Color side) const;

 private:
  MoveGenerator m_move_gen;
};

}  // namespace gambit::model
