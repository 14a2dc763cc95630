#include "gambit/model/move.hpp"

namespace gambit::model {

std::string Move::toString() const {
  std::string s = core::squareName(m_from) + core::squareName(m_to);
  switch (m_promotion) {
    case core::PieceType::Queen:
      s += 'q';
      break;
    case core::PieceType::Rook:
      s += 'r';
      break;
    case core::PieceType::Bishop:
      s += 'b';
      break;
    case core::PieceType::Knight:
      s += 'n';
      break;
    default:
      break;
  }
  return s;
}

}  // namespace gambit::model
