#include "gambit/view/board_view.hpp"

#include <SFML/Graphics.hpp>
#include <cmath>

#include "gambit/view/render_constants.hpp"

namespace gambit::view {

namespace {

inline float snapf(float v) {
  return std::round(v);
}

// White glyphs U+2654..U+2659, black U+265A..U+265F, both in K Q R B N P order.
sf::Uint32 pieceGlyph(const model::Piece& p) {
  sf::Uint32 offset = 0;
  switch (p.type) {
    case core::PieceType::King:
      offset = 0;
      break;
    case core::PieceType::Queen:
      offset = 1;
      break;
    case core::PieceType::Rook:
      offset = 2;
      break;
    case core::PieceType::Bishop:
      offset = 3;
      break;
    case core::PieceType::Knight:
      offset = 4;
      break;
    case core::PieceType::Pawn:
      offset = 5;
      break;
    default:
      return U'?';
  }
  const sf::Uint32 base = p.color == core::Color::White ? 0x2654 : 0x265A;
  return base + offset;
}

}  // namespace

void BoardView::renderBoard(sf::RenderWindow& window) const {
  const float sqPx = static_cast<float>(constant::SQUARE_PX_SIZE);
  sf::RectangleShape cell({sqPx, sqPx});
  for (int row = 0; row < core::BOARD_SIZE; ++row) {
    for (int col = 0; col < core::BOARD_SIZE; ++col) {
      const core::Square sq = core::to_square(row, col);
      cell.setPosition(getSquareScreenPos(sq));
      cell.setFillColor((row + col) % 2 == 0 ? constant::COL_LIGHT_SQUARE
                                             : constant::COL_DARK_SQUARE);
      window.draw(cell);
    }
  }
}

void BoardView::renderPieces(sf::RenderWindow& window, const sf::Font& font,
                             const model::Board& board) const {
  const float sqPx = static_cast<float>(constant::SQUARE_PX_SIZE);
  const auto charSize = static_cast<unsigned int>(sqPx * constant::GLYPH_SCALE);

  for (core::Square sq = 0; sq < core::NO_SQUARE; ++sq) {
    const auto piece = board.getPiece(sq);
    if (!piece) continue;

    sf::Text glyph(sf::String(pieceGlyph(*piece)), font, charSize);
    glyph.setFillColor(constant::COL_PIECE);
    // centre on the glyph's own bounds, fonts disagree about baselines
    const sf::FloatRect b = glyph.getLocalBounds();
    glyph.setOrigin(b.left + b.width / 2.f, b.top + b.height / 2.f);
    const sf::Vector2f corner = getSquareScreenPos(sq);
    glyph.setPosition(snapf(corner.x + sqPx / 2.f), snapf(corner.y + sqPx / 2.f));
    window.draw(glyph);
  }
}

[[nodiscard]] sf::Vector2f BoardView::getSquareScreenPos(core::Square sq) const {
  int screenRow = core::row_of(sq);
  int screenCol = core::col_of(sq);
  if (m_flipped) {
    screenRow = core::BOARD_SIZE - 1 - screenRow;
    screenCol = core::BOARD_SIZE - 1 - screenCol;
  }
  return {static_cast<float>(constant::BOARD_OFFSET_X + screenCol * constant::SQUARE_PX_SIZE),
          static_cast<float>(constant::BOARD_OFFSET_Y + screenRow * constant::SQUARE_PX_SIZE)};
}

core::Square BoardView::mousePosToSquare(core::MousePos mousePos) const {
  const int originX = static_cast<int>(constant::BOARD_OFFSET_X);
  const int originY = static_cast<int>(constant::BOARD_OFFSET_Y);
  const int edge = static_cast<int>(constant::BOARD_PX_SIZE);

  if (mousePos.x < originX || mousePos.x >= originX + edge || mousePos.y < originY ||
      mousePos.y >= originY + edge) {
    return core::NO_SQUARE;
  }

  const int sqPx = static_cast<int>(constant::SQUARE_PX_SIZE);
  int col = (mousePos.x - originX) / sqPx;
  int row = (mousePos.y - originY) / sqPx;
  if (m_flipped) {
    col = core::BOARD_SIZE - 1 - col;
    row = core::BOARD_SIZE - 1 - row;
  }
  return core::to_square(row, col);
}

void BoardView::toggleFlipped() {
  m_flipped = !m_flipped;
}

void BoardView::setFlipped(bool flipped) {
  m_flipped = flipped;
}

[[nodiscard]] bool BoardView::isFlipped() const {
  return m_flipped;
}

}  // namespace gambit::view
