#include <cassert>
#include <optional>
#include <stdexcept>

#include "gambit/constants.hpp"
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

static model::GameStatus play(model::ChessGame& game, const char* from, const char* to) {
  const auto m = findMove(game, from, to);
  assert(m.has_value());
  return game.applyMove(*m);
}

int main() {
  // Fresh game is INITIAL, the first move makes it ONGOING
  {
    model::ChessGame game;
    assert(game.getStatus().phase == core::GameResult::INITIAL);
    assert(!game.getStatus().isTerminal());
    assert(!game.getStatus().winner().has_value());

    const auto st = play(game, "e2", "e4");
    assert(st.phase == core::GameResult::ONGOING);
    assert(st.sideToMove == core::Color::Black);
    assert(!st.inCheck);
  }

  // Fool's mate
  {
    model::ChessGame game;
    play(game, "f2", "f3");
    play(game, "e7", "e5");
    play(game, "g2", "g4");
    const auto st = play(game, "d8", "h4");
    assert(st.phase == core::GameResult::CHECKMATE);
    assert(st.isTerminal());
    assert(st.sideToMove == core::Color::White);
    assert(st.inCheck);
    assert(st.winner() == core::Color::Black);
    assert(game.getStatus().phase == core::GameResult::CHECKMATE);

    // the finished game offers nothing and ignores moves
    assert(game.legalMoves(sq("e1")).empty());
    assert(game.legalMoves(sq("a2")).empty());
  }

  // Stalemate reached by a move
  {
    model::ChessGame game;
    game.setPosition("7k/8/5QK1/8/8/8/8/8 w - - 0 1");
    assert(game.getStatus().phase == core::GameResult::INITIAL);
    const auto st = play(game, "f6", "f7");
    assert(st.phase == core::GameResult::STALEMATE);
    assert(st.sideToMove == core::Color::Black);
    assert(!st.inCheck);
    assert(!st.winner().has_value());
  }

  // A loaded stalemate starts terminal
  {
    model::ChessGame game;
    game.setPosition("7k/5Q2/6K1/8/8/8/8/8 b - - 0 1");
    assert(game.getStatus().phase == core::GameResult::STALEMATE);
  }

  // Stale moves are ignored and leave the game untouched
  {
    model::ChessGame game;
    const auto e4 = findMove(game, "e2", "e4");
    assert(e4.has_value());
    game.applyMove(*e4);
    const std::string fen = game.getFen();

    const auto st = game.applyMove(*e4);
    assert(st.phase == core::GameResult::ONGOING);
    assert(st.sideToMove == core::Color::Black);
    assert(game.getFen() == fen);
  }

  // Moves from a finished game are ignored too
  {
    model::ChessGame game;
    const auto f3 = findMove(game, "f2", "f3");
    assert(f3.has_value());
    play(game, "f2", "f3");
    play(game, "e7", "e5");
    play(game, "g2", "g4");
    play(game, "d8", "h4");
    const std::string fen = game.getFen();
    const auto st = game.applyMove(*f3);
    assert(st.phase == core::GameResult::CHECKMATE);
    assert(game.getFen() == fen);
  }

  // reset() restores the standard start exactly
  {
    model::ChessGame game;
    play(game, "e2", "e4");
    play(game, "d7", "d5");
    play(game, "e4", "d5");
    play(game, "e8", "d7");
    game.reset();

    assert(game.getFen() == core::START_FEN);
    assert(game.getPosition() == model::fen::parse(core::START_FEN));
    assert(game.getSideToMove() == core::Color::White);
    assert(game.getPosition().getState().castlingRights == model::Castling::ALL);
    assert(game.getPosition().getState().enPassantSquare == core::NO_SQUARE);
    assert(game.getStatus().phase == core::GameResult::INITIAL);
    assert(game.getKingSquare(core::Color::White) == sq("e1"));
    assert(game.getKingSquare(core::Color::Black) == sq("e8"));
  }

  // reset() also leaves a finished game
  {
    model::ChessGame game;
    play(game, "f2", "f3");
    play(game, "e7", "e5");
    play(game, "g2", "g4");
    play(game, "d8", "h4");
    game.reset();
    assert(game.getStatus().phase == core::GameResult::INITIAL);
    assert(game.legalMoves(sq("e2")).size() == 2);
  }

  return 0;
}
