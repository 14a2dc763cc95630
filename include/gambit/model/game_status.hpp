#pragma once
#include <optional>

#include "../chess_types.hpp"
#include "../constants.hpp"
#include "position.hpp"

namespace gambit::model {

struct GameStatus {
  core::GameResult phase = core::GameResult::INITIAL;
  core::Color sideToMove = core::Color::White;
  bool inCheck = false;

  [[nodiscard]] bool isTerminal() const noexcept {
    return phase == core::GameResult::CHECKMATE || phase == core::GameResult::STALEMATE;
  }
  // Only a checkmate has a winner: the side that is not to move.
  [[nodiscard]] std::optional<core::Color> winner() const noexcept {
    if (phase != core::GameResult::CHECKMATE) return std::nullopt;
    return ~sideToMove;
  }
};

// Classifies `pos` from the point of view of its side to move. Never returns INITIAL.
[[nodiscard]] GameStatus evaluateGameState(const Position& pos);

}  // namespace gambit::model
