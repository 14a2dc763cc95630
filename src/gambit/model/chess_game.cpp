#include "gambit/model/chess_game.hpp"

#include <algorithm>
#include <iostream>

#include "gambit/model/attack_detector.hpp"
#include "gambit/model/fen.hpp"

namespace gambit::model {

ChessGame::ChessGame() {
  reset();
}

void ChessGame::reset() {
  setPosition(core::START_FEN);
}

void ChessGame::setPosition(const std::string& fen) {
  Position next = fen::parse(fen);  // throws before anything is touched

  m_position = next;
  m_legal_moves.clear();
  m_status = evaluateGameState(m_position);
  if (!m_status.isTerminal()) m_status.phase = core::GameResult::INITIAL;
}

std::string ChessGame::getFen() const {
  return fen::serialize(m_position);
}

const std::vector<Move>& ChessGame::legalMoves(core::Square sq) {
  core::requireSquare(sq);
  m_legal_moves.clear();
  if (m_status.isTerminal()) return m_legal_moves;
  m_validator.legalMoves(m_position, sq, m_legal_moves);
  return m_legal_moves;
}

const std::vector<Move>& ChessGame::legalMoves(int row, int col) {
  return legalMoves(core::makeSquare(row, col));
}

GameStatus ChessGame::applyMove(const Move& move) {
  if (m_status.isTerminal()) {
    std::cerr << "[ChessGame] ignoring move " << move.toString() << ": game is over\n";
    return m_status;
  }

  std::vector<Move> candidates;
  m_validator.legalMoves(m_position, move.from(), candidates);
  if (std::find(candidates.begin(), candidates.end(), move) == candidates.end()) {
    std::cerr << "[ChessGame] ignoring move " << move.toString()
              << ": not legal in current position\n";
    return m_status;
  }

  m_position.doMove(move);
  m_legal_moves.clear();
  m_status = evaluateGameState(m_position);
  return m_status;
}

std::optional<Piece> ChessGame::pieceAt(core::Square sq) const {
  core::requireSquare(sq);
  return m_position.getBoard().getPiece(sq);
}

std::optional<Piece> ChessGame::pieceAt(int row, int col) const {
  return pieceAt(core::makeSquare(row, col));
}

bool ChessGame::isKingInCheck(core::Color side) const {
  return model::isKingInCheck(m_position.getBoard(), side);
}

core::Square ChessGame::getKingSquare(core::Color side) const {
  return m_position.getBoard().findKing(side);
}

}  // namespace gambit::model
