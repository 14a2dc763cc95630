#include "gambit/model/board.hpp"

#include <cassert>

namespace gambit::model {

void Board::clear() noexcept {
  m_squares.fill(std::nullopt);
}

void Board::setPiece(core::Square sq, Piece p) noexcept {
  assert(core::is_valid(sq));
  if (p.type == core::PieceType::None) {
    m_squares[sq].reset();
    return;
  }
  m_squares[sq] = p;
}

void Board::removePiece(core::Square sq) noexcept {
  assert(core::is_valid(sq));
  m_squares[sq].reset();
}

std::optional<Piece> Board::getPiece(core::Square sq) const noexcept {
  assert(core::is_valid(sq));
  return m_squares[sq];
}

void Board::movePiece(core::Square from, core::Square to) noexcept {
  assert(core::is_valid(from) && core::is_valid(to));
  if (from == to) return;
  m_squares[to] = m_squares[from];
  m_squares[from].reset();
}

core::Square Board::findKing(core::Color c) const noexcept {
  for (core::Square s = 0; s < core::NO_SQUARE; ++s) {
    const auto& p = m_squares[s];
    if (p && p->type == core::PieceType::King && p->color == c) return s;
  }
  return core::NO_SQUARE;
}

}  // namespace gambit::model
