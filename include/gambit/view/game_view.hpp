#pragma once

#include <SFML/Graphics/RenderWindow.hpp>
#include <string>

#include "../chess_types.hpp"
#include "../controller/mousepos.hpp"
#include "../model/board.hpp"
#include "board_view.hpp"
#include "highlight_manager.hpp"
#include "status_bar.hpp"

namespace sf {
class Font;
}

namespace gambit::view {

class GameView {
 public:
  /**
   * @brief Binds the view to @p window and loads the glyph font.
   * @throws std::runtime_error if @p fontPath cannot be loaded.
   */
  GameView(sf::RenderWindow &window, const std::string &fontPath, bool flipped = false);
  ~GameView() = default;

  void render(const model::Board &board);

  void setStatus(const std::string &text);

  void highlightSelectSquare(core::Square pos);
  void highlightTargetSquare(core::Square pos);
  void clearAllHighlights();

  [[nodiscard]] core::Square mousePosToSquare(core::MousePos mousePos) const;
  [[nodiscard]] bool isOnResetButton(core::MousePos mousePos) const;
  void toggleBoardOrientation();

 private:
  sf::RenderWindow &m_window;
  const sf::Font &m_font;

  BoardView m_board_view;
  HighlightManager m_highlight_manager;
  StatusBar m_status_bar;
};

}  // namespace gambit::view
