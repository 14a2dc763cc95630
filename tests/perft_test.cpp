#include <algorithm>
#include <cassert>
#include <cstdint>
#include <utility>
#include <vector>

#include "gambit/constants.hpp"
#include "gambit/model/attack_detector.hpp"
#include "gambit/model/fen.hpp"
#include "gambit/model/move_generator.hpp"
#include "gambit/model/move_validator.hpp"
#include "gambit/model/perft.hpp"

using namespace gambit;

static const char* KIWIPETE =
    "r3k2r/p1ppqpb1/bn2pnp1/3PN3/1p2P3/2N2Q1p/PPPBBPPP/R3K2R w KQkq - 0 1";
static const char* POSITION_3 = "8/2p5/3p4/KP5r/1R3p1k/8/4P1P1/8 w - - 0 1";

// Walks the legal move tree and checks both directions of the legality filter:
// kept moves leave the mover's king safe, dropped ones do not.
static std::uint64_t checkLegality(const model::Position& pos, int depth) {
  if (depth == 0) return 1;

  const model::MoveGenerator gen{};
  const model::MoveValidator validator{};
  const core::Color us = pos.sideToMove();

  std::vector<model::Move> pseudo;
  gen.generatePseudoLegalMoves(pos, us, pseudo);
  std::vector<model::Move> legal;
  validator.legalMoves(pos, legal);
  assert(legal.size() <= pseudo.size());

  std::uint64_t nodes = 0;
  for (const auto& m : pseudo) {
    model::Position copy = pos;
    copy.doMove(m);
    const bool kingSafe = !model::isKingInCheck(copy.getBoard(), us);
    const bool kept = std::find(legal.begin(), legal.end(), m) != legal.end();
    assert(kingSafe == kept);
    if (kept) nodes += checkLegality(copy, depth - 1);
  }
  return nodes;
}

int main() {
  {
    const model::Position start = model::fen::parse(core::START_FEN);
    assert(model::perft(start, 0) == 1ULL);
    assert(model::perft(start, 1) == 20ULL);
    assert(model::perft(start, 2) == 400ULL);
    assert(model::perft(start, 3) == 8902ULL);
  }

  {
    const model::Position kiwi = model::fen::parse(KIWIPETE);
    assert(model::perft(kiwi, 1) == 48ULL);
    assert(model::perft(kiwi, 2) == 2039ULL);
  }

  {
    const model::Position p3 = model::fen::parse(POSITION_3);
    assert(model::perft(p3, 1) == 14ULL);
    assert(model::perft(p3, 2) == 191ULL);
    assert(model::perft(p3, 3) == 2812ULL);
  }

  // divide sums to the plain count
  {
    const model::Position kiwi = model::fen::parse(KIWIPETE);
    std::vector<std::pair<model::Move, std::uint64_t>> parts;
    model::perftDivide(kiwi, 2, parts);
    assert(parts.size() == 48);
    std::uint64_t total = 0;
    for (const auto& [m, n] : parts) total += n;
    assert(total == 2039ULL);
  }

  // Legality filter agrees with a direct king-safety check everywhere
  {
    assert(checkLegality(model::fen::parse(core::START_FEN), 3) == 8902ULL);
    assert(checkLegality(model::fen::parse(KIWIPETE), 2) == 2039ULL);
    assert(checkLegality(model::fen::parse(POSITION_3), 3) == 2812ULL);
  }

  return 0;
}
