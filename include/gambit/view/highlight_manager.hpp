#pragma once
#include <unordered_set>

#include "../chess_types.hpp"
#include "board_view.hpp"

namespace gambit::view {

class HighlightManager {
 public:
  explicit HighlightManager(const BoardView& boardRef);

  void highlightSelectSquare(core::Square pos);
  void highlightTargetSquare(core::Square pos);
  void clearAllHighlights();

  [[nodiscard]] core::Square selectedSquare() const { return m_select_square; }
  [[nodiscard]] bool isTarget(core::Square pos) const;

  void render(sf::RenderWindow& window) const;

 private:
  void renderBorder(sf::RenderWindow& window, core::Square sq, const sf::Color& color) const;

  const BoardView& m_board_view_ref;

  core::Square m_select_square = core::NO_SQUARE;
  std::unordered_set<core::Square> m_target_squares;
};

}  // namespace gambit::view
