#include "gambit/model/attack_detector.hpp"

#include <cstddef>

#include "gambit/model/core/offsets.hpp"

namespace gambit::model {

namespace {

using core::Color;
using core::PieceType;

inline bool isPiece(const Board& b, int row, int col, PieceType t, Color c) noexcept {
  if (!core::on_board(row, col)) return false;
  const auto p = b.getPiece(core::to_square(row, col));
  return p && p->type == t && p->color == c;
}

// Walks each ray from the target; only the first occupied square can attack.
template <std::size_t N>
bool slidingAttack(const Board& b, int row, int col, Color by,
                   const std::array<offsets::Step, N>& dirs, PieceType a,
                   PieceType q) noexcept {
  for (const auto& d : dirs) {
    int r = row + d.dr, c = col + d.dc;
    while (core::on_board(r, c)) {
      const auto p = b.getPiece(core::to_square(r, c));
      if (p) {
        if (p->color == by && (p->type == a || p->type == q)) return true;
        break;
      }
      r += d.dr;
      c += d.dc;
    }
  }
  return false;
}

}  // namespace

bool isSquareAttacked(const Board& b, core::Square sq, core::Color by) noexcept {
  const int row = core::row_of(sq);
  const int col = core::col_of(sq);

  // Pawn: an attacker sits one row behind the target from its own point of view
  const int pr = row - offsets::pawn_dir(by);
  if (isPiece(b, pr, col - 1, PieceType::Pawn, by)) return true;
  if (isPiece(b, pr, col + 1, PieceType::Pawn, by)) return true;

  for (const auto& d : offsets::KNIGHT)
    if (isPiece(b, row + d.dr, col + d.dc, PieceType::Knight, by)) return true;

  for (const auto& d : offsets::KING)
    if (isPiece(b, row + d.dr, col + d.dc, PieceType::King, by)) return true;

  if (slidingAttack(b, row, col, by, offsets::ORTHOGONAL, PieceType::Rook, PieceType::Queen))
    return true;

  return slidingAttack(b, row, col, by, offsets::DIAGONAL, PieceType::Bishop, PieceType::Queen);
}

bool isKingInCheck(const Board& b, core::Color side) noexcept {
  const core::Square ksq = b.findKing(side);
  if (ksq == core::NO_SQUARE) return true;
  return isSquareAttacked(b, ksq, ~side);
}

}  // namespace gambit::model
