#pragma once
#include <array>
#include <optional>

#include "piece.hpp"

namespace gambit::model {

// Mailbox grid, one optional piece per square. Plain value: copying a Board
// copies the whole position of the pieces.
class Board {
 public:
  Board() = default;

  void clear() noexcept;

  void setPiece(core::Square sq, Piece p) noexcept;
  void removePiece(core::Square sq) noexcept;
  [[nodiscard]] std::optional<Piece> getPiece(core::Square sq) const noexcept;
  [[nodiscard]] bool isEmpty(core::Square sq) const noexcept { return !m_squares[sq].has_value(); }

  // Moves whatever stands on `from` to `to`, replacing anything on `to`.
  void movePiece(core::Square from, core::Square to) noexcept;

  // First square holding a king of `c`, NO_SQUARE if there is none.
  [[nodiscard]] core::Square findKing(core::Color c) const noexcept;

  friend bool operator==(const Board& a, const Board& b) noexcept {
    return a.m_squares == b.m_squares;
  }

 private:
  std::array<std::optional<Piece>, 64> m_squares{};
};

}  // namespace gambit::model
