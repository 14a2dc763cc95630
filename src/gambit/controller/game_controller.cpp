#include "gambit/controller/game_controller.hpp"

#include <SFML/Window/Event.hpp>
#include <iostream>

#include "gambit/model/chess_game.hpp"
#include "gambit/view/status_text.hpp"

namespace gambit::controller {

namespace {
inline bool isValid(core::Square sq) {
  return sq != core::NO_SQUARE;
}
}  // namespace

GameController::GameController(view::GameView &gView, model::ChessGame &game)
    : m_game_view(gView), m_chess_game(game) {
  m_input_manager.setOnClick([this](core::MousePos pos) { this->onClick(pos); });
  m_input_manager.setOnKey([this](sf::Keyboard::Key key) { this->onKey(key); });
  syncStatus();
}

void GameController::handleEvent(const sf::Event &event) {
  m_input_manager.processEvent(event);
}

void GameController::render() {
  m_game_view.render(m_chess_game.getPosition().getBoard());
}

void GameController::resetGame() {
  m_chess_game.reset();
  deselectSquare();
  syncStatus();
  std::cerr << "[GameController] game reset\n";
}

void GameController::onKey(sf::Keyboard::Key key) {
  if (key == sf::Keyboard::R) {
    resetGame();
  } else if (key == sf::Keyboard::F) {
    m_game_view.toggleBoardOrientation();
  }
}

void GameController::onClick(core::MousePos mousePos) {
  if (m_game_view.isOnResetButton(mousePos)) {
    resetGame();
    return;
  }

  // board is frozen after checkmate / stalemate
  if (m_chess_game.getStatus().isTerminal()) return;

  const core::Square sq = m_game_view.mousePosToSquare(mousePos);
  if (!isValid(sq)) {
    deselectSquare();
    return;
  }

  // If something is selected, try that move first
  if (isValid(m_selected_sq) && tryMove(sq)) return;

  const auto piece = m_chess_game.pieceAt(sq);
  if (piece && piece->color == m_chess_game.getSideToMove() && sq != m_selected_sq)
    selectSquare(sq);
  else
    deselectSquare();
}

void GameController::selectSquare(core::Square sq) {
  deselectSquare();
  m_selected_sq = sq;
  m_selected_moves = m_chess_game.legalMoves(sq);

  m_game_view.highlightSelectSquare(sq);
  for (const auto &m : m_selected_moves) m_game_view.highlightTargetSquare(m.to());
}

void GameController::deselectSquare() {
  m_game_view.clearAllHighlights();
  m_selected_sq = core::NO_SQUARE;
  m_selected_moves.clear();
}

bool GameController::tryMove(core::Square to) {
  for (const auto &m : m_selected_moves) {
    if (m.to() != to) continue;
    const model::Move chosen = m;
    deselectSquare();
    const model::GameStatus status = m_chess_game.applyMove(chosen);
    syncStatus();
    if (status.isTerminal())
      std::cerr << "[GameController] game over: " << view::statusText(status) << "\n";
    return true;
  }
  return false;
}

void GameController::syncStatus() {
  m_game_view.setStatus(view::statusText(m_chess_game.getStatus()));
}

} // namespace gambit::controller
