#include "gambit/controller/input_manager.hpp"

#include <SFML/Window/Event.hpp>

namespace gambit::controller {

void InputManager::setOnClick(ClickCallback cb) { m_on_click = std::move(cb); }

void InputManager::setOnKey(KeyCallback cb) { m_on_key = std::move(cb); }

void InputManager::processEvent(const sf::Event &event) {
  switch (event.type) {
  case sf::Event::MouseButtonPressed:
    if (event.mouseButton.button == sf::Mouse::Left)
      m_press_pos = core::MousePos(event.mouseButton.x, event.mouseButton.y);
    break;

  case sf::Event::MouseButtonReleased:
    if (event.mouseButton.button == sf::Mouse::Left && m_press_pos) {
      core::MousePos releasePos(event.mouseButton.x, event.mouseButton.y);
      // a press that wandered off is a cancelled click, not a drag
      if (isClick(m_press_pos.value(), releasePos) && m_on_click)
        m_on_click(releasePos);
      m_press_pos.reset();
    }
    break;

  case sf::Event::KeyPressed:
    if (m_on_key)
      m_on_key(event.key.code);
    break;

  case sf::Event::LostFocus:
    m_press_pos.reset();
    break;

  default:
    break;
  }
}

[[nodiscard]] bool InputManager::isClick(const core::MousePos &start,
                                         const core::MousePos &end,
                                         int threshold) const {
  int dx = end.x - start.x;
  int dy = end.y - start.y;
  return (dx * dx + dy * dy) <= (threshold * threshold);
}

} // namespace gambit::controller
