#pragma once
#include <cstdint>
#include <type_traits>

#include "../chess_types.hpp"

namespace gambit::model {

namespace Castling {
enum : std::uint8_t { WK = 1, WQ = 2, BK = 4, BQ = 8, ALL = WK | WQ | BK | BQ };
}

struct GameState {
  core::Color sideToMove = core::Color::White;
  std::uint8_t castlingRights = Castling::ALL;
  core::Square enPassantSquare = core::NO_SQUARE;
  // Counters only travel through FEN; no draw rule reads them.
  std::uint16_t halfmoveClock = 0;
  std::uint32_t fullmoveNumber = 1;
};

constexpr inline bool operator==(const GameState& a, const GameState& b) noexcept {
  return a.sideToMove == b.sideToMove && a.castlingRights == b.castlingRights &&
         a.enPassantSquare == b.enPassantSquare && a.halfmoveClock == b.halfmoveClock &&
         a.fullmoveNumber == b.fullmoveNumber;
}

static_assert(Castling::ALL <= 0xF, "Castling rights must fit in 4 bits");
static_assert(std::is_trivially_copyable_v<GameState>, "GameState should be POD");

}  // namespace gambit::model
