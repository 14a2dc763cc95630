#pragma once
#include <cstdint>
#include <string>
#include <type_traits>

#include "../chess_types.hpp"

namespace gambit::model {

enum class CastleSide : std::uint8_t { None = 0, KingSide, QueenSide };

class MoveGenerator;

/**
 * @brief A generated move. Only MoveGenerator can create one, so every Move in
 * circulation came out of move generation for some position.
 */
class Move {
 public:
  [[nodiscard]] constexpr core::Square from() const noexcept { return m_from; }
  [[nodiscard]] constexpr core::Square to() const noexcept { return m_to; }
  [[nodiscard]] constexpr core::PieceType promotion() const noexcept { return m_promotion; }
  [[nodiscard]] constexpr bool isEnPassant() const noexcept { return m_en_passant; }
  [[nodiscard]] constexpr CastleSide castle() const noexcept { return m_castle; }
  [[nodiscard]] constexpr bool isCastle() const noexcept { return m_castle != CastleSide::None; }
  [[nodiscard]] constexpr bool isPromotion() const noexcept {
    return m_promotion != core::PieceType::None;
  }

  // Coordinate notation, e.g. "e2e4" or "e7e8q".
  [[nodiscard]] std::string toString() const;

  friend constexpr bool operator==(const Move& a, const Move& b) noexcept {
    return a.m_from == b.m_from && a.m_to == b.m_to && a.m_promotion == b.m_promotion &&
           a.m_en_passant == b.m_en_passant && a.m_castle == b.m_castle;
  }
  friend constexpr bool operator!=(const Move& a, const Move& b) noexcept { return !(a == b); }

 private:
  friend class MoveGenerator;

  constexpr Move(core::Square f, core::Square t, core::PieceType promo = core::PieceType::None,
                 bool ep = false, CastleSide cs = CastleSide::None) noexcept
      : m_from(f), m_to(t), m_promotion(promo), m_en_passant(ep), m_castle(cs) {}

  core::Square m_from;
  core::Square m_to;
  core::PieceType m_promotion;
  bool m_en_passant;
  CastleSide m_castle;
};

static_assert(std::is_trivially_copyable_v<Move>, "Move must be trivially copyable");

}  // namespace gambit::model
