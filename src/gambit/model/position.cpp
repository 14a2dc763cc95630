#include "gambit/model/position.hpp"

#include <array>
#include <cstdint>
#include <cstdlib>
#include <limits>

#include "gambit/model/core/offsets.hpp"

namespace gambit::model {

namespace {

// --------- Castling rights tied to a rook's home corner ----------
constexpr std::array<std::uint8_t, 64> CR_ROOK_CORNER = [] {
  std::array<std::uint8_t, 64> a{};
  a[sq::H1] = Castling::WK;
  a[sq::A1] = Castling::WQ;
  a[sq::H8] = Castling::BK;
  a[sq::A8] = Castling::BQ;
  return a;
}();

constexpr std::uint8_t kingRights(core::Color c) noexcept {
  return c == core::Color::White ? (Castling::WK | Castling::WQ) : (Castling::BK | Castling::BQ);
}

}  // namespace

void Position::doMove(const Move& m) {
  const auto fromPiece = m_board.getPiece(m.from());
  if (!fromPiece) return;

  const Piece moving = *fromPiece;
  const core::Color us = moving.color;
  const auto captured = m_board.getPiece(m.to());

  // 1) a rook taken on its home corner takes its castling right with it
  if (captured && captured->type == core::PieceType::Rook)
    m_state.castlingRights &= static_cast<std::uint8_t>(~CR_ROOK_CORNER[m.to()]);

  // 2) + 3) lift the piece, then resolve what lands on the destination
  m_board.removePiece(m.from());

  Piece placed = moving;
  if (m.isEnPassant() && moving.type == core::PieceType::Pawn) {
    // the victim stands on our origin row, in the destination column
    m_board.removePiece(core::to_square(core::row_of(m.from()), core::col_of(m.to())));
  } else if (m.isPromotion()) {
    placed.type = m.promotion();
  } else if (moving.type == core::PieceType::Pawn &&
             core::row_of(m.to()) == offsets::promotion_row(us)) {
    placed.type = core::PieceType::Queen;
  }
  m_board.setPiece(m.to(), placed);

  // 4) king: both rights gone; a castle drags the corner rook along
  if (moving.type == core::PieceType::King) {
    m_state.castlingRights &= static_cast<std::uint8_t>(~kingRights(us));
    if (m.isCastle()) {
      const int row = core::row_of(m.to());
      const bool kingSide = (m.castle() == CastleSide::KingSide);
      const core::Square rookFrom = core::to_square(row, kingSide ? 7 : 0);
      const core::Square rookTo = core::to_square(row, kingSide ? 5 : 3);
      if (m_board.getPiece(rookFrom)) m_board.movePiece(rookFrom, rookTo);
    }
  }

  // 5) rook leaving its corner
  if (moving.type == core::PieceType::Rook)
    m_state.castlingRights &= static_cast<std::uint8_t>(~CR_ROOK_CORNER[m.from()]);

  // 6) en-passant target only survives one ply
  m_state.enPassantSquare = core::NO_SQUARE;
  if (moving.type == core::PieceType::Pawn &&
      std::abs(core::row_of(m.to()) - core::row_of(m.from())) == 2) {
    m_state.enPassantSquare = core::to_square(
        (core::row_of(m.from()) + core::row_of(m.to())) / 2, core::col_of(m.from()));
  }

  if (moving.type == core::PieceType::Pawn || captured || m.isEnPassant())
    m_state.halfmoveClock = 0;
  else if (m_state.halfmoveClock < std::numeric_limits<std::uint16_t>::max())
    ++m_state.halfmoveClock;

  // 7) side flip & fullmove
  m_state.sideToMove = ~us;
  if (us == core::Color::Black) ++m_state.fullmoveNumber;
}

}  // namespace gambit::model
