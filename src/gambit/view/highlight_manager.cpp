#include "gambit/view/highlight_manager.hpp"

#include <SFML/Graphics.hpp>

#include "gambit/view/render_constants.hpp"

namespace gambit::view {

HighlightManager::HighlightManager(const BoardView& boardRef)
    : m_board_view_ref(boardRef), m_target_squares() {}

void HighlightManager::highlightSelectSquare(core::Square pos) {
  m_select_square = pos;
}

void HighlightManager::highlightTargetSquare(core::Square pos) {
  m_target_squares.insert(pos);
}

void HighlightManager::clearAllHighlights() {
  m_select_square = core::NO_SQUARE;
  m_target_squares.clear();
}

bool HighlightManager::isTarget(core::Square pos) const {
  return m_target_squares.count(pos) != 0;
}

void HighlightManager::renderBorder(sf::RenderWindow& window, core::Square sq,
                                    const sf::Color& color) const {
  const float t = constant::HIGHLIGHT_THICKNESS;
  const float inner = static_cast<float>(constant::SQUARE_PX_SIZE) - 2.f * t;
  // outline grows outwards, so shrink the shape to keep it inside the square
  sf::RectangleShape frame({inner, inner});
  const sf::Vector2f corner = m_board_view_ref.getSquareScreenPos(sq);
  frame.setPosition(corner.x + t, corner.y + t);
  frame.setFillColor(sf::Color::Transparent);
  frame.setOutlineThickness(t);
  frame.setOutlineColor(color);
  window.draw(frame);
}

void HighlightManager::render(sf::RenderWindow& window) const {
  for (core::Square sq : m_target_squares)
    renderBorder(window, sq, constant::COL_TARGET_BORDER);
  if (m_select_square != core::NO_SQUARE)
    renderBorder(window, m_select_square, constant::COL_SELECT_BORDER);
}

}  // namespace gambit::view
