#pragma once
#include <array>

#include "../../chess_types.hpp"

// =======================================================
// Step tables for the mailbox board.
// An offset is {dRow, dCol}; row grows towards White's side.
// =======================================================

namespace gambit::model::offsets {

struct Step {
  int dr;
  int dc;
};

constexpr std::array<Step, 8> KNIGHT = {
    {{2, 1}, {2, -1}, {-2, 1}, {-2, -1}, {1, 2}, {1, -2}, {-1, 2}, {-1, -2}}};

constexpr std::array<Step, 8> KING = {
    {{1, 0}, {-1, 0}, {0, 1}, {0, -1}, {1, 1}, {1, -1}, {-1, 1}, {-1, -1}}};

constexpr std::array<Step, 4> ORTHOGONAL = {{{1, 0}, {-1, 0}, {0, 1}, {0, -1}}};

constexpr std::array<Step, 4> DIAGONAL = {{{1, 1}, {1, -1}, {-1, 1}, {-1, -1}}};

// White pawns advance towards row 0.
[[nodiscard]] constexpr inline int pawn_dir(core::Color c) noexcept {
  return c == core::Color::White ? -1 : 1;
}
[[nodiscard]] constexpr inline int pawn_start_row(core::Color c) noexcept {
  return c == core::Color::White ? 6 : 1;
}
[[nodiscard]] constexpr inline int promotion_row(core::Color c) noexcept {
  return c == core::Color::White ? 0 : 7;
}

// Back rank of `c`, where its king and rooks start.
[[nodiscard]] constexpr inline int home_row(core::Color c) noexcept {
  return c == core::Color::White ? 7 : 0;
}

}  // namespace gambit::model::offsets
