#pragma once

#include <SFML/Graphics/Font.hpp>
#include <SFML/Graphics/RectangleShape.hpp>
#include <SFML/Graphics/RenderWindow.hpp>
#include <string>

#include "../controller/mousepos.hpp"

namespace gambit::view {

// Strip under the board: status line on the left, Reset button on the right.
class StatusBar {
 public:
  StatusBar();

  void layout();
  void setStatus(const std::string& text);
  [[nodiscard]] const std::string& getStatus() const { return m_status; }

  void render(sf::RenderWindow& window, const sf::Font& font) const;
  [[nodiscard]] bool isOnResetButton(core::MousePos mousePos) const;

 private:
  sf::RectangleShape m_background;
  sf::RectangleShape m_reset_button;
  std::string m_status;
};

}  // namespace gambit::view
