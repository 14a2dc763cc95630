#include <cassert>
#include <optional>
#include <stdexcept>
#include <string>

#include "gambit/constants.hpp"
#include "gambit/model/chess_game.hpp"
#include "gambit/model/fen.hpp"

using namespace gambit;

static void play(model::ChessGame& game, const char* from, const char* to) {
  for (const auto& m : game.legalMoves(core::squareFromName(from))) {
    if (m.to() == core::squareFromName(to)) {
      const model::Move chosen = m;
      game.applyMove(chosen);
      return;
    }
  }
  assert(false && "move not found");
}

int main() {
  // Well-formedness
  {
    assert(model::fen::isFenWellFormed(core::START_FEN));
    assert(model::fen::isFenWellFormed("8/8/8/8/8/8/8/8 b - - 12 40"));
    assert(!model::fen::isFenWellFormed(""));
    assert(!model::fen::isFenWellFormed("rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP w KQkq - 0 1"));
    assert(!model::fen::isFenWellFormed("rnbqkbnr/pppppppp/9/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1"));
    assert(!model::fen::isFenWellFormed("rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNX w KQkq - 0 1"));
    assert(!model::fen::isFenWellFormed("rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR x KQkq - 0 1"));
    assert(!model::fen::isFenWellFormed("rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQxq - 0 1"));
    assert(!model::fen::isFenWellFormed("rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq e4 0 1"));
    assert(!model::fen::isFenWellFormed("rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - -1 1"));
    assert(!model::fen::isFenWellFormed("rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1 x"));

    // castling letters may not repeat
    assert(!model::fen::isFenWellFormed("rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KKQ - 0 1"));
    assert(!model::fen::isFenWellFormed("rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w Kqq - 0 1"));
    assert(model::fen::isFenWellFormed("rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w qkQK - 0 1"));

    // en-passant rank must match the side to move
    assert(!model::fen::isFenWellFormed("rnbqkbnr/pppppppp/8/8/4P3/8/PPPP1PPP/RNBQKBNR w KQkq e3 0 1"));
    assert(model::fen::isFenWellFormed("rnbqkbnr/pppppppp/8/8/4P3/8/PPPP1PPP/RNBQKBNR b KQkq e3 0 1"));
    assert(!model::fen::isFenWellFormed("rnbqkbnr/pp1ppppp/8/2p5/4P3/8/PPPP1PPP/RNBQKBNR b KQkq c6 0 2"));
    assert(model::fen::isFenWellFormed("rnbqkbnr/pp1ppppp/8/2p5/4P3/8/PPPP1PPP/RNBQKBNR w KQkq c6 0 2"));

    // counters must fit: halfmove up to 65535, fullmove from 1
    assert(!model::fen::isFenWellFormed("8/8/8/8/8/8/8/8 w - - 70000 1"));
    assert(!model::fen::isFenWellFormed("8/8/8/8/8/8/8/8 w - - 65536 1"));
    assert(model::fen::isFenWellFormed("8/8/8/8/8/8/8/8 w - - 65535 1"));
    assert(!model::fen::isFenWellFormed("8/8/8/8/8/8/8/8 w - - 0 0"));
  }

  // Largest halfmove clock survives a round trip
  {
    const std::string fen = "4k3/8/8/8/8/8/8/4K3 w - - 65535 300";
    assert(model::fen::serialize(model::fen::parse(fen)) == fen);

    // a quiet move holds the clock at its ceiling
    model::ChessGame game;
    game.setPosition(fen);
    play(game, "e1", "d1");
    assert(game.getFen() == "4k3/8/8/8/8/8/8/3K4 b - - 65535 300");
  }

  // Out-of-range counter is rejected rather than wrapped
  {
    model::ChessGame game;
    const std::string before = game.getFen();

    bool thrown = false;
    try {
      game.setPosition("4k3/8/8/8/8/8/8/4K3 w - - 70000 1");
    } catch (const std::runtime_error&) {
      thrown = true;
    }
    assert(thrown);
    assert(game.getFen() == before);
  }

  // Start position survives a round trip
  {
    model::ChessGame game;
    assert(game.getFen() == core::START_FEN);
    const model::Position parsed = model::fen::parse(core::START_FEN);
    assert(model::fen::serialize(parsed) == core::START_FEN);
  }

  // FEN tracks moves, counters and en-passant target
  {
    model::ChessGame game;
    play(game, "e2", "e4");
    assert(game.getFen() == "rnbqkbnr/pppppppp/8/8/4P3/8/PPPP1PPP/RNBQKBNR b KQkq e3 0 1");
    play(game, "c7", "c5");
    assert(game.getFen() == "rnbqkbnr/pp1ppppp/8/2p5/4P3/8/PPPP1PPP/RNBQKBNR w KQkq c6 0 2");
    play(game, "g1", "f3");
    assert(game.getFen() == "rnbqkbnr/pp1ppppp/8/2p5/4P3/5N2/PPPP1PPP/RNBQKB1R b KQkq - 1 2");

    const std::string fen = game.getFen();
    model::ChessGame other;
    other.setPosition(fen);
    assert(other.getFen() == fen);
    assert(other.getPosition() == game.getPosition());
  }

  // Malformed input throws and keeps the previous position
  {
    model::ChessGame game;
    play(game, "d2", "d4");
    const std::string before = game.getFen();

    bool thrown = false;
    try {
      game.setPosition("not a fen");
    } catch (const std::runtime_error&) {
      thrown = true;
    }
    assert(thrown);
    assert(game.getFen() == before);
    assert(game.getStatus().phase == core::GameResult::ONGOING);
  }

  return 0;
}
