#include <cassert>
#include <optional>
#include <string>

#include "gambit/model/chess_game.hpp"
#include "gambit/model/fen.hpp"

using namespace gambit;

static core::Square sq(const char* name) {
  return core::squareFromName(name);
}

static std::optional<model::Move> findMove(model::ChessGame& game, const char* from,
                                           const char* to) {
  for (const auto& m : game.legalMoves(sq(from)))
    if (m.to() == sq(to)) return m;
  return std::nullopt;
}

static void play(model::ChessGame& game, const char* from, const char* to) {
  const auto m = findMove(game, from, to);
  assert(m.has_value());
  game.applyMove(*m);
}

static bool canCastle(const std::string& fen, const char* kingTo) {
  model::ChessGame game;
  game.setPosition(fen);
  const char* kingFrom = game.getSideToMove() == core::Color::White ? "e1" : "e8";
  const auto m = findMove(game, kingFrom, kingTo);
  return m.has_value() && m->isCastle();
}

int main() {
  // En passant: offered right after the double push, removes the passed pawn
  {
    model::ChessGame game;
    play(game, "e2", "e4");
    play(game, "a7", "a6");
    play(game, "e4", "e5");
    play(game, "d7", "d5");
    assert(game.getPosition().getState().enPassantSquare == sq("d6"));

    const auto ep = findMove(game, "e5", "d6");
    assert(ep.has_value());
    assert(ep->isEnPassant());
    // only the target square is offered diagonally
    assert(!findMove(game, "e5", "f6").has_value());

    game.applyMove(*ep);
    assert(game.pieceAt(sq("d6"))->type == core::PieceType::Pawn);
    assert(game.pieceAt(sq("d6"))->color == core::Color::White);
    assert(!game.pieceAt(sq("d5")).has_value());
    assert(!game.pieceAt(sq("e5")).has_value());
    assert(game.getPosition().getState().enPassantSquare == core::NO_SQUARE);
  }

  // En passant is gone one move later
  {
    model::ChessGame game;
    play(game, "e2", "e4");
    play(game, "a7", "a6");
    play(game, "e4", "e5");
    play(game, "d7", "d5");
    play(game, "h2", "h3");
    play(game, "h7", "h6");
    assert(!findMove(game, "e5", "d6").has_value());
  }

  // An en-passant capture that exposes the king along the rank is illegal
  {
    model::ChessGame game;
    game.setPosition("8/8/8/KPp4r/8/8/8/4k3 w - c6 0 1");
    assert(!findMove(game, "b5", "c6").has_value());
    assert(findMove(game, "b5", "b6").has_value());
  }

  // Castling needs right, empty path, rook at home and a safe king path
  {
    const std::string base = "r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1";
    assert(canCastle(base, "g1"));
    assert(canCastle(base, "c1"));

    // right revoked
    assert(!canCastle("r3k2r/8/8/8/8/8/8/R3K2R w Qkq - 0 1", "g1"));
    assert(canCastle("r3k2r/8/8/8/8/8/8/R3K2R w Qkq - 0 1", "c1"));

    // piece in between, including b1 which the king never crosses
    assert(!canCastle("r3k2r/8/8/8/8/8/8/R3KB1R w KQkq - 0 1", "g1"));
    assert(!canCastle("r3k2r/8/8/8/8/8/8/RN2K2R w KQkq - 0 1", "c1"));
    assert(canCastle("r3k2r/8/8/8/8/8/8/RN2K2R w KQkq - 0 1", "g1"));

    // rook missing from its corner
    assert(!canCastle("r3k2r/8/8/8/8/8/8/R3K3 w KQkq - 0 1", "g1"));

    // king in check
    assert(!canCastle("r3k2r/8/8/8/4r3/8/8/R3K2R w KQkq - 0 1", "g1"));
    assert(!canCastle("r3k2r/8/8/8/4r3/8/8/R3K2R w KQkq - 0 1", "c1"));

    // square crossed or landed on is attacked
    assert(!canCastle("r3k2r/8/8/8/5r2/8/8/R3K2R w KQkq - 0 1", "g1"));
    assert(canCastle("r3k2r/8/8/8/5r2/8/8/R3K2R w KQkq - 0 1", "c1"));
    assert(!canCastle("r3k2r/8/8/8/6r1/8/8/R3K2R w KQkq - 0 1", "g1"));
    assert(!canCastle("r3k2r/8/8/8/3r4/8/8/R3K2R w KQkq - 0 1", "c1"));
    // b1 under attack does not matter
    assert(canCastle("r3k2r/8/8/8/1r6/8/8/R3K2R w KQkq - 0 1", "c1"));

    // black side mirrors it
    assert(canCastle("r3k2r/8/8/8/8/8/8/R3K2R b KQkq - 0 1", "g8"));
    assert(canCastle("r3k2r/8/8/8/8/8/8/R3K2R b KQkq - 0 1", "c8"));
    assert(!canCastle("r3k2r/8/8/8/8/8/8/R3K2R b KQk - 0 1", "c8"));
  }

  // Executing a castle moves the rook and drops both rights of that side
  {
    model::ChessGame game;
    game.setPosition("r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1");
    play(game, "e1", "g1");
    assert(game.pieceAt(sq("g1"))->type == core::PieceType::King);
    assert(game.pieceAt(sq("f1"))->type == core::PieceType::Rook);
    assert(!game.pieceAt(sq("h1")).has_value());
    assert(!game.pieceAt(sq("e1")).has_value());
    assert(game.getPosition().getState().castlingRights ==
           (model::Castling::BK | model::Castling::BQ));

    play(game, "e8", "c8");
    assert(game.pieceAt(sq("c8"))->type == core::PieceType::King);
    assert(game.pieceAt(sq("d8"))->type == core::PieceType::Rook);
    assert(!game.pieceAt(sq("a8")).has_value());
    assert(game.getPosition().getState().castlingRights == 0);
    assert(game.getFen() == "2kr3r/8/8/8/8/8/8/R4RK1 w - - 2 2");
  }

  // Rook moves and rook captures revoke the matching right
  {
    model::ChessGame game;
    game.setPosition("r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1");
    play(game, "h1", "h8");  // takes the h8 rook
    assert(game.getPosition().getState().castlingRights ==
           (model::Castling::WQ | model::Castling::BQ));

    play(game, "e8", "d7");  // black king steps out of check
    play(game, "a1", "a2");
    assert(game.getPosition().getState().castlingRights == 0);
  }

  // Pawn reaching the last rank becomes a queen
  {
    model::ChessGame game;
    game.setPosition("1n5k/P7/8/8/8/8/8/K7 w - - 0 1");
    const auto& moves = game.legalMoves(sq("a7"));
    assert(moves.size() == 2);  // push and capture on b8
    for (const auto& m : moves) {
      assert(m.isPromotion());
      assert(m.promotion() == core::PieceType::Queen);
    }
    play(game, "a7", "b8");
    const auto q = game.pieceAt(sq("b8"));
    assert(q.has_value());
    assert(q->type == core::PieceType::Queen);
    assert(q->color == core::Color::White);
    assert(game.getStatus().inCheck);
    assert(game.getStatus().phase == core::GameResult::ONGOING);
  }

  // Black promotes on row 7
  {
    model::ChessGame game;
    game.setPosition("K6k/8/8/8/8/8/7p/8 b - - 0 1");
    play(game, "h2", "h1");
    assert(game.pieceAt(sq("h1"))->type == core::PieceType::Queen);
    assert(game.pieceAt(sq("h1"))->color == core::Color::Black);
  }

  return 0;
}
