#include "gambit/view/game_view.hpp"

#include "gambit/view/font_table.hpp"
#include "gambit/view/render_constants.hpp"

namespace gambit::view {

GameView::GameView(sf::RenderWindow &window, const std::string &fontPath, bool flipped)
    : m_window(window),
      m_font(FontTable::getInstance().get(fontPath)),
      m_board_view(),
      m_highlight_manager(m_board_view),
      m_status_bar() {
  m_board_view.setFlipped(flipped);
  m_status_bar.layout();
}

void GameView::render(const model::Board &board) {
  m_board_view.renderBoard(m_window);
  m_highlight_manager.render(m_window);
  m_board_view.renderPieces(m_window, m_font, board);
  m_status_bar.render(m_window, m_font);
}

void GameView::setStatus(const std::string &text) {
  m_status_bar.setStatus(text);
}

void GameView::highlightSelectSquare(core::Square pos) {
  m_highlight_manager.highlightSelectSquare(pos);
}

void GameView::highlightTargetSquare(core::Square pos) {
  m_highlight_manager.highlightTargetSquare(pos);
}

void GameView::clearAllHighlights() {
  m_highlight_manager.clearAllHighlights();
}

[[nodiscard]] core::Square GameView::mousePosToSquare(core::MousePos mousePos) const {
  return m_board_view.mousePosToSquare(mousePos);
}

[[nodiscard]] bool GameView::isOnResetButton(core::MousePos mousePos) const {
  return m_status_bar.isOnResetButton(mousePos);
}

void GameView::toggleBoardOrientation() {
  m_board_view.toggleFlipped();
}

}  // namespace gambit::view
