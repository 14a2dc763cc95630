#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace gambit::core {

// Square index = row * 8 + col. Row 0 is Black's back rank, row 7 White's.
using Square = std::uint8_t;
constexpr Square NO_SQUARE = 64;
constexpr int BOARD_SIZE = 8;

enum class PieceType : std::uint8_t { Pawn, Knight, Bishop, Rook, Queen, King, None };
enum class Color : std::uint8_t { White = 0, Black = 1 };

constexpr inline core::Color operator~(core::Color c) {
  return c == core::Color::White ? core::Color::Black : core::Color::White;
}

class InvalidSquare : public std::out_of_range {
 public:
  explicit InvalidSquare(const std::string& what) : std::out_of_range(what) {}
};

[[nodiscard]] constexpr inline bool on_board(int row, int col) noexcept {
  return row >= 0 && row < BOARD_SIZE && col >= 0 && col < BOARD_SIZE;
}

[[nodiscard]] constexpr inline bool is_valid(Square sq) noexcept {
  return sq < NO_SQUARE;
}

[[nodiscard]] constexpr inline int row_of(Square sq) noexcept {
  return static_cast<int>(sq) / BOARD_SIZE;
}

[[nodiscard]] constexpr inline int col_of(Square sq) noexcept {
  return static_cast<int>(sq) % BOARD_SIZE;
}

// Unchecked; callers guarantee on_board(row, col).
[[nodiscard]] constexpr inline Square to_square(int row, int col) noexcept {
  return static_cast<Square>(row * BOARD_SIZE + col);
}

// Checked variant for coordinates coming from outside the engine.
inline Square makeSquare(int row, int col) {
  if (!on_board(row, col))
    throw InvalidSquare("square (" + std::to_string(row) + ", " + std::to_string(col) +
                        ") is off the board");
  return to_square(row, col);
}

inline void requireSquare(Square sq) {
  if (!is_valid(sq))
    throw InvalidSquare("square index " + std::to_string(static_cast<int>(sq)) +
                        " is off the board");
}

// "e4" style name; row 7 is rank 1.
inline std::string squareName(Square sq) {
  if (!is_valid(sq)) return "-";
  std::string s;
  s += static_cast<char>('a' + col_of(sq));
  s += static_cast<char>('8' - row_of(sq));
  return s;
}

// Inverse of squareName, NO_SQUARE for anything malformed.
inline Square squareFromName(const std::string& name) {
  if (name.size() != 2) return NO_SQUARE;
  const char f = name[0];
  const char r = name[1];
  if (f < 'a' || f > 'h' || r < '1' || r > '8') return NO_SQUARE;
  return to_square('8' - r, f - 'a');
}

}  // namespace gambit::core
