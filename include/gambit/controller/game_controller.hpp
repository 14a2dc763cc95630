#pragma once

#include <vector>

// Forward declaration to avoid heavy SFML header
namespace sf {
class Event;
}

#include <SFML/Window/Keyboard.hpp>

#include "../chess_types.hpp"
#include "../model/move.hpp"
#include "../view/game_view.hpp"
#include "input_manager.hpp"

namespace gambit::model {
class ChessGame;
}  // namespace gambit::model

namespace gambit::controller {

/**
 * @brief Turns clicks and key presses into ChessGame calls and keeps the view
 * in step with the game.
 *
 * Click a piece of the side to move to select it, click one of its highlighted
 * destinations to play the move. Once the game has ended the board ignores
 * clicks until it is reset (Reset button or the R key). F flips the board.
 */
class GameController {
public:
  explicit GameController(view::GameView &gView, model::ChessGame &game);

  void handleEvent(const sf::Event &event);
  void render();

  // Starts over from the standard position.
  void resetGame();

private:
  void onClick(core::MousePos mousePos);
  void onKey(sf::Keyboard::Key key);

  void selectSquare(core::Square sq);
  void deselectSquare();
  [[nodiscard]] bool tryMove(core::Square to);
  void syncStatus();

  // ---------------- Members ----------------
  view::GameView &m_game_view;    ///< Responsible for rendering.
  model::ChessGame &m_chess_game; ///< Game model containing rules and state.
  InputManager m_input_manager;   ///< Handles raw input processing.

  core::Square m_selected_sq = core::NO_SQUARE; ///< Currently selected square.
  std::vector<model::Move> m_selected_moves;    ///< Legal moves of the selection.
};

} // namespace gambit::controller
