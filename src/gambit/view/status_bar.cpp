#include "gambit/view/status_bar.hpp"

#include <SFML/Graphics/Text.hpp>
#include <SFML/Window/Mouse.hpp>
#include <cmath>

#include "gambit/view/render_constants.hpp"

namespace gambit::view {

namespace {
constexpr float BUTTON_WIDTH = 96.f;
constexpr float BUTTON_HEIGHT = 36.f;
constexpr unsigned int STATUS_CHAR_SIZE = 20;
constexpr unsigned int BUTTON_CHAR_SIZE = 18;
}  // namespace

StatusBar::StatusBar() : m_background(), m_reset_button(), m_status() {
  layout();
}

void StatusBar::layout() {
  const float left = static_cast<float>(constant::BOARD_OFFSET_X);
  const float top =
      static_cast<float>(constant::BOARD_OFFSET_Y + constant::BOARD_PX_SIZE + constant::WINDOW_MARGIN / 2);
  const float width = static_cast<float>(constant::BOARD_PX_SIZE);
  const float height = static_cast<float>(constant::STATUS_BAR_HEIGHT);

  m_background.setSize({width, height});
  m_background.setPosition(left, top);
  m_background.setFillColor(sf::Color(255, 255, 255, 20));
  m_background.setOutlineColor(constant::COL_BORDER);
  m_background.setOutlineThickness(1.f);

  m_reset_button.setSize({BUTTON_WIDTH, BUTTON_HEIGHT});
  m_reset_button.setPosition(std::round(left + width - BUTTON_WIDTH - 12.f),
                             std::round(top + (height - BUTTON_HEIGHT) / 2.f));
  m_reset_button.setOutlineColor(constant::COL_BORDER);
  m_reset_button.setOutlineThickness(1.f);
}

void StatusBar::setStatus(const std::string& text) {
  m_status = text;
}

void StatusBar::render(sf::RenderWindow& window, const sf::Font& font) const {
  window.draw(m_background);

  sf::Text status(m_status, font, STATUS_CHAR_SIZE);
  status.setFillColor(constant::COL_TEXT);
  const sf::FloatRect sb = status.getLocalBounds();
  const sf::Vector2f bgPos = m_background.getPosition();
  status.setPosition(std::round(bgPos.x + 12.f - sb.left),
                     std::round(bgPos.y + (m_background.getSize().y - sb.height) / 2.f - sb.top));
  window.draw(status);

  const sf::Vector2f mouse = window.mapPixelToCoords(sf::Mouse::getPosition(window));
  sf::RectangleShape button = m_reset_button;
  button.setFillColor(button.getGlobalBounds().contains(mouse) ? constant::COL_BUTTON_HOVER
                                                               : constant::COL_BUTTON);
  window.draw(button);

  sf::Text label(constant::STR_RESET_LABEL, font, BUTTON_CHAR_SIZE);
  label.setFillColor(constant::COL_TEXT);
  const sf::FloatRect lb = label.getLocalBounds();
  const sf::Vector2f bPos = button.getPosition();
  label.setPosition(std::round(bPos.x + (BUTTON_WIDTH - lb.width) / 2.f - lb.left),
                    std::round(bPos.y + (BUTTON_HEIGHT - lb.height) / 2.f - lb.top));
  window.draw(label);
}

bool StatusBar::isOnResetButton(core::MousePos mousePos) const {
  const sf::Vector2f pos = m_reset_button.getPosition();
  const sf::Vector2f size = m_reset_button.getSize();
  return mousePos.x >= pos.x && mousePos.x <= pos.x + size.x && mousePos.y >= pos.y &&
         mousePos.y <= pos.y + size.y;
}

}  // namespace gambit::view
