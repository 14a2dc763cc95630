#pragma once

#include "../chess_types.hpp"

namespace gambit::model {

struct Piece {
  core::PieceType type = core::PieceType::None;
  core::Color color = core::Color::White;
};

constexpr inline bool operator==(const Piece& a, const Piece& b) noexcept {
  return a.type == b.type && a.color == b.color;
}
constexpr inline bool operator!=(const Piece& a, const Piece& b) noexcept {
  return !(a == b);
}

}  // namespace gambit::model
