#include "gambit/model/move_generator.hpp"

#include <cstdint>
#include <initializer_list>

#include "gambit/model/attack_detector.hpp"

namespace gambit::model {

namespace {

using core::Color;
using core::PieceType;
using core::Square;

// Squares a piece of `us` may step onto: empty or enemy-occupied.
inline bool isFreeOrEnemy(const Board& b, int row, int col, Color us) noexcept {
  const auto p = b.getPiece(core::to_square(row, col));
  return !p || p->color != us;
}

struct CastleSpec {
  std::uint8_t right;
  int rookCol;
  int kingToCol;
  int passCol;            // square the king crosses, the rook lands here
  int emptyFrom, emptyTo;  // inclusive column range strictly between king and rook
};

constexpr CastleSpec castleSpec(Color us, CastleSide side) noexcept {
  const bool white = (us == Color::White);
  if (side == CastleSide::KingSide)
    return CastleSpec{white ? Castling::WK : Castling::BK, 7, 6, 5, 5, 6};
  return CastleSpec{white ? Castling::WQ : Castling::BQ, 0, 2, 3, 1, 3};
}

constexpr int KING_HOME_COL = 4;

}  // namespace

const std::array<MoveGenerator::GenFn, 6> MoveGenerator::s_generators = {
    &MoveGenerator::genPawnMoves,  &MoveGenerator::genKnightMoves, &MoveGenerator::genBishopMoves,
    &MoveGenerator::genRookMoves,  &MoveGenerator::genQueenMoves,  &MoveGenerator::genKingMoves};

void MoveGenerator::generatePseudoLegalMoves(const Position& pos, Square from,
                                             std::vector<Move>& out) const {
  const auto p = pos.getBoard().getPiece(from);
  if (!p || p->type == PieceType::None) return;
  s_generators[static_cast<int>(p->type)](pos, from, *p, out);
}

void MoveGenerator::generatePseudoLegalMoves(const Position& pos, Color side,
                                             std::vector<Move>& out) const {
  const Board& b = pos.getBoard();
  for (Square s = 0; s < core::NO_SQUARE; ++s) {
    const auto p = b.getPiece(s);
    if (p && p->color == side) s_generators[static_cast<int>(p->type)](pos, s, *p, out);
  }
}

// ---------------- Pawn ----------------

void MoveGenerator::addPawnMove(Square from, Square to, Color us, std::vector<Move>& out) {
  if (core::row_of(to) == offsets::promotion_row(us))
    out.push_back(Move{from, to, PieceType::Queen});  // auto-queen
  else
    out.push_back(Move{from, to});
}

void MoveGenerator::genPawnMoves(const Position& pos, Square from, Piece p,
                                 std::vector<Move>& out) {
  const Board& b = pos.getBoard();
  const Color us = p.color;
  const int row = core::row_of(from);
  const int col = core::col_of(from);
  const int dir = offsets::pawn_dir(us);
  const int nr = row + dir;
  if (!core::on_board(nr, col)) return;

  // pushes
  if (b.isEmpty(core::to_square(nr, col))) {
    addPawnMove(from, core::to_square(nr, col), us, out);
    const int nr2 = row + 2 * dir;
    if (row == offsets::pawn_start_row(us) && b.isEmpty(core::to_square(nr2, col)))
      out.push_back(Move{from, core::to_square(nr2, col)});
  }

  // captures
  for (int dc : {-1, 1}) {
    const int nc = col + dc;
    if (!core::on_board(nr, nc)) continue;
    const auto target = b.getPiece(core::to_square(nr, nc));
    if (target && target->color != us) addPawnMove(from, core::to_square(nr, nc), us, out);
  }

  // en passant: the victim stands beside us, on our current row
  const Square ep = pos.getState().enPassantSquare;
  if (ep == core::NO_SQUARE || core::row_of(ep) != nr) return;
  const int ec = core::col_of(ep);
  if (ec != col - 1 && ec != col + 1) return;
  if (!b.isEmpty(ep)) return;
  const auto victim = b.getPiece(core::to_square(row, ec));
  if (victim && victim->type == PieceType::Pawn && victim->color != us)
    out.push_back(Move{from, ep, PieceType::None, true});
}

// ---------------- Knight ----------------

void MoveGenerator::genKnightMoves(const Position& pos, Square from, Piece p,
                                   std::vector<Move>& out) {
  const Board& b = pos.getBoard();
  const int row = core::row_of(from);
  const int col = core::col_of(from);
  for (const auto& d : offsets::KNIGHT) {
    const int nr = row + d.dr, nc = col + d.dc;
    if (!core::on_board(nr, nc)) continue;
    if (isFreeOrEnemy(b, nr, nc, p.color)) out.push_back(Move{from, core::to_square(nr, nc)});
  }
}

// ---------------- Sliders ----------------

void MoveGenerator::addSlides(const Board& b, Square from, Color us, const offsets::Step* dirs,
                              std::size_t n, std::vector<Move>& out) {
  const int row = core::row_of(from);
  const int col = core::col_of(from);
  for (std::size_t i = 0; i < n; ++i) {
    int nr = row + dirs[i].dr, nc = col + dirs[i].dc;
    while (core::on_board(nr, nc)) {
      const Square to = core::to_square(nr, nc);
      const auto occ = b.getPiece(to);
      if (!occ) {
        out.push_back(Move{from, to});
      } else {
        if (occ->color != us) out.push_back(Move{from, to});
        break;
      }
      nr += dirs[i].dr;
      nc += dirs[i].dc;
    }
  }
}

void MoveGenerator::genBishopMoves(const Position& pos, Square from, Piece p,
                                   std::vector<Move>& out) {
  addSlides(pos.getBoard(), from, p.color, offsets::DIAGONAL.data(), offsets::DIAGONAL.size(),
            out);
}

void MoveGenerator::genRookMoves(const Position& pos, Square from, Piece p,
                                 std::vector<Move>& out) {
  addSlides(pos.getBoard(), from, p.color, offsets::ORTHOGONAL.data(),
            offsets::ORTHOGONAL.size(), out);
}

void MoveGenerator::genQueenMoves(const Position& pos, Square from, Piece p,
                                  std::vector<Move>& out) {
  addSlides(pos.getBoard(), from, p.color, offsets::KING.data(), offsets::KING.size(), out);
}

// ---------------- King + castling ----------------

void MoveGenerator::genKingMoves(const Position& pos, Square from, Piece p,
                                 std::vector<Move>& out) {
  const Board& b = pos.getBoard();
  const int row = core::row_of(from);
  const int col = core::col_of(from);
  for (const auto& d : offsets::KING) {
    const int nr = row + d.dr, nc = col + d.dc;
    if (!core::on_board(nr, nc)) continue;
    if (isFreeOrEnemy(b, nr, nc, p.color)) out.push_back(Move{from, core::to_square(nr, nc)});
  }

  const int home = offsets::home_row(p.color);
  if (from != core::to_square(home, KING_HOME_COL)) return;
  addCastle(pos, p.color, CastleSide::KingSide, out);
  addCastle(pos, p.color, CastleSide::QueenSide, out);
}

void MoveGenerator::addCastle(const Position& pos, Color us, CastleSide side,
                              std::vector<Move>& out) {
  const Board& b = pos.getBoard();
  const CastleSpec cs = castleSpec(us, side);
  if (!(pos.getState().castlingRights & cs.right)) return;

  const int home = offsets::home_row(us);
  const auto rook = b.getPiece(core::to_square(home, cs.rookCol));
  if (!rook || rook->type != PieceType::Rook || rook->color != us) return;

  for (int c = cs.emptyFrom; c <= cs.emptyTo; ++c)
    if (!b.isEmpty(core::to_square(home, c))) return;

  // start, transit and destination must all be safe
  const Color them = ~us;
  for (int c : {KING_HOME_COL, cs.passCol, cs.kingToCol})
    if (isSquareAttacked(b, core::to_square(home, c), them)) return;

  out.push_back(Move{core::to_square(home, KING_HOME_COL), core::to_square(home, cs.kingToCol),
                     PieceType::None, false, side});
}

}  // namespace gambit::model
