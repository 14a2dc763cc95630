#pragma once

#include <SFML/Graphics/RenderWindow.hpp>
#include <SFML/System/Vector2.hpp>

#include "../chess_types.hpp"
#include "../controller/mousepos.hpp"
#include "../model/board.hpp"

namespace sf {
class Font;
}

namespace gambit::view {

// Geometry and drawing of the 8x8 grid. Row 0 of the model is drawn at the
// top unless the board is flipped.
class BoardView {
 public:
  BoardView() = default;

  void renderBoard(sf::RenderWindow& window) const;
  void renderPieces(sf::RenderWindow& window, const sf::Font& font,
                    const model::Board& board) const;

  // Top-left corner of the square on screen.
  [[nodiscard]] sf::Vector2f getSquareScreenPos(core::Square sq) const;
  // NO_SQUARE for positions outside the board.
  [[nodiscard]] core::Square mousePosToSquare(core::MousePos mousePos) const;

  void toggleFlipped();
  void setFlipped(bool flipped);
  [[nodiscard]] bool isFlipped() const;

 private:
  bool m_flipped{false};
};

}  // namespace gambit::view
