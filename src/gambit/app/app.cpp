#include "gambit/app/app.hpp"

#include <SFML/Graphics/RenderWindow.hpp>
#include <SFML/Window/Event.hpp>
#include <iostream>
#include <stdexcept>

#include "gambit/controller/game_controller.hpp"
#include "gambit/model/chess_game.hpp"
#include "gambit/view/font_table.hpp"
#include "gambit/view/game_view.hpp"
#include "gambit/view/render_constants.hpp"

namespace gambit::app {

int App::run() {
  try {
    view::constant::updateBoardSize(m_config.boardPx);
    view::FontTable::getInstance().preLoad(m_config.fontPath);

    model::ChessGame chessGame;
    if (m_config.startFen != core::START_FEN) chessGame.setPosition(m_config.startFen);

    sf::RenderWindow window(
        sf::VideoMode(view::constant::WINDOW_WIDTH, view::constant::WINDOW_HEIGHT),
        view::constant::STR_WINDOW_TITLE, sf::Style::Titlebar | sf::Style::Close);
    window.setFramerateLimit(60);

    view::GameView gameView(window, m_config.fontPath, m_config.flipped);
    controller::GameController gameController(gameView, chessGame);

    while (window.isOpen()) {
      sf::Event event;
      while (window.pollEvent(event)) {
        if (event.type == sf::Event::Closed) window.close();
        gameController.handleEvent(event);
      }
      window.clear(view::constant::COL_BACKGROUND);
      gameController.render();
      window.display();
    }
  } catch (const std::exception& e) {
    std::cerr << "[App] fatal: " << e.what() << "\n";
    return 1;
  }
  return 0;
}

}  // namespace gambit::app
