#include "gambit/model/move_validator.hpp"

#include "gambit/model/attack_detector.hpp"

namespace gambit::model {

bool MoveValidator::isLegal(const Position& pos, const Move& move, core::Color side) const {
  Position copy = pos;
  copy.doMove(move);
  return !isKingInCheck(copy.getBoard(), side);
}

void MoveValidator::legalMoves(const Position& pos, core::Square from,
                               std::vector<Move>& out) const {
  const auto p = pos.getBoard().getPiece(from);
  if (!p || p->color != pos.sideToMove()) return;

  std::vector<Move> pseudo;
  m_move_gen.generatePseudoLegalMoves(pos, from, pseudo);
  for (const auto& m : pseudo)
    if (isLegal(pos, m, p->color)) out.push_back(m);
}

void MoveValidator::legalMoves(const Position& pos, std::vector<Move>& out) const {
  const core::Color us = pos.sideToMove();
  std::vector<Move> pseudo;
  pseudo.reserve(64);
  m_move_gen.generatePseudoLegalMoves(pos, us, pseudo);
  for (const auto& m : pseudo)
    if (isLegal(pos, m, us)) out.push_back(m);
}

bool MoveValidator::hasAnyLegalMove(const Position& pos, core::Color side) const {
  std::vector<Move> pseudo;
  for (core::Square s = 0; s < core::NO_SQUARE; ++s) {
    const auto p = pos.getBoard().getPiece(s);
    if (!p || p->color != side) continue;
    pseudo.clear();
    m_move_gen.generatePseudoLegalMoves(pos, s, pseudo);
    for (const auto& m : pseudo)
      if (isLegal(pos, m, side)) return true;
  }
  return false;
}

}  // namespace gambit::model
