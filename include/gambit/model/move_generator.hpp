#pragma once

#include <array>
#include <cstddef>
#include <vector>

#include "core/offsets.hpp"
#include "move.hpp"
#include "position.hpp"

namespace gambit::model {

class MoveGenerator {
 public:
  // Pseudo-legal moves of the piece on `from` (nothing for an empty square).
  void generatePseudoLegalMoves(const Position& pos, core::Square from,
                                std::vector<Move>& out) const;

  // Pseudo-legal moves of every piece of `side`.
  void generatePseudoLegalMoves(const Position& pos, core::Color side,
                                std::vector<Move>& out) const;

 private:
  using GenFn = void (*)(const Position&, core::Square, Piece, std::vector<Move>&);

  // Indexed by core::PieceType.
  static const std::array<GenFn, 6> s_generators;

  static void genPawnMoves(const Position& pos, core::Square from, Piece p,
                           std::vector<Move>& out);
  static void genKnightMoves(const Position& pos, core::Square from, Piece p,
                             std::vector<Move>& out);
  static void genBishopMoves(const Position& pos, core::Square from, Piece p,
                             std::vector<Move>& out);
  static void genRookMoves(const Position& pos, core::Square from, Piece p,
                           std::vector<Move>& out);
  static void genQueenMoves(const Position& pos, core::Square from, Piece p,
                            std::vector<Move>& out);
  static void genKingMoves(const Position& pos, core::Square from, Piece p,
                           std::vector<Move>& out);

  static void addSlides(const Board& b, core::Square from, core::Color us,
                        const offsets::Step* dirs, std::size_t n, std::vector<Move>& out);
  static void addPawnMove(core::Square from, core::Square to, core::Color us,
                          std::vector<Move>& out);
  static void addCastle(const Position& pos, core::Color us, CastleSide side,
                        std::vector<Move>& out);
};

}  // namespace gambit::model
