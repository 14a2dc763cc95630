#pragma once

#include "../chess_types.hpp"
#include "board.hpp"

namespace gambit::model {

// ---------------- Attack queries ----------------

// True if any piece of `by` reaches `sq` in one step (pins and checks ignored).
[[nodiscard]] bool isSquareAttacked(const Board& b, core::Square sq, core::Color by) noexcept;

// A side without a king on the board counts as being in check.
[[nodiscard]] bool isKingInCheck(const Board& b, core::Color side) noexcept;

}  // namespace gambit::model
