#pragma once

#include <optional>
#include <string>
#include <vector>

#include "../constants.hpp"
#include "game_status.hpp"
#include "move_validator.hpp"
#include "piece.hpp"
#include "position.hpp"

namespace gambit::model {

/**
 * @brief The engine as the presentation layer sees it.
 *
 * Holds the single live position. All calls are synchronous; a host that
 * calls in from several threads has to serialize the calls itself.
 */
class ChessGame {
 public:
  ChessGame();

  /**
   * @brief Legal moves of the piece on @p sq for the side to move.
   * @throws core::InvalidSquare if @p sq is off the board.
   * @note The reference points into m_legal_moves, which the next
   *       legalMoves(), successful applyMove(), reset() or setPosition()
   *       call clears. Copy out what must outlive that call.
   */
  const std::vector<Move>& legalMoves(core::Square sq);
  const std::vector<Move>& legalMoves(int row, int col);

  /**
   * @brief Plays a move previously returned by legalMoves() and classifies the
   * new position. A move that is not legal here (stale, or the game is over) is
   * logged and ignored; the unchanged status is returned.
   */
  GameStatus applyMove(const Move& move);

  /// @throws core::InvalidSquare if @p sq is off the board.
  std::optional<Piece> pieceAt(core::Square sq) const;
  std::optional<Piece> pieceAt(int row, int col) const;

  // Standard start position, full castling rights, White to move, phase INITIAL.
  void reset();

  void setPosition(const std::string& fen);
  std::string getFen() const;  ///< Current position as FEN

  const GameStatus& getStatus() const { return m_status; }
  core::Color getSideToMove() const { return m_position.sideToMove(); }
  bool isKingInCheck(core::Color side) const;
  core::Square getKingSquare(core::Color side) const;
  const Position& getPosition() const { return m_position; }

 private:
  MoveValidator m_validator;
  Position m_position;
  GameStatus m_status;
  std::vector<Move> m_legal_moves;
};

}  // namespace gambit::model
