#pragma once

#include "board.hpp"
#include "game_state.hpp"
#include "move.hpp"

namespace gambit::model {

// Home squares (row 0 = Black's back rank).
namespace sq {
constexpr core::Square A8 = 0, H8 = 7;
constexpr core::Square A1 = 56, H1 = 63;
}  // namespace sq

/**
 * @brief Board plus side to move, castling rights and en-passant target.
 *
 * Position is a plain value. doMove() is the only routine that changes it; the
 * legality check runs the same doMove() on a copy and throws the copy away.
 */
class Position {
 public:
  Position() = default;

  Board& getBoard() { return m_board; }
  const Board& getBoard() const { return m_board; }
  GameState& getState() { return m_state; }
  const GameState& getState() const { return m_state; }

  [[nodiscard]] core::Color sideToMove() const noexcept { return m_state.sideToMove; }

  // Applies a generated move unconditionally. Legality is the caller's business.
  void doMove(const Move& m);

  friend bool operator==(const Position& a, const Position& b) noexcept {
    return a.m_board == b.m_board && a.m_state == b.m_state;
  }

 private:
  Board m_board;
  GameState m_state;
};

}  // namespace gambit::model
