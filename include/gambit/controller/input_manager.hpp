#pragma once

namespace sf {
class Event;
}

#include <functional>
#include <optional>

#include <SFML/Window/Keyboard.hpp>

#include "mousepos.hpp"

namespace gambit::controller {

class InputManager {
public:
  using ClickCallback = std::function<void(core::MousePos)>;
  using KeyCallback = std::function<void(sf::Keyboard::Key)>;

  void setOnClick(ClickCallback cb);
  void setOnKey(KeyCallback cb);

  void processEvent(const sf::Event &event);

private:
  std::optional<core::MousePos> m_press_pos; ///< Where the left button went down.

  ClickCallback m_on_click = nullptr; ///< Registered click callback.
  KeyCallback m_on_key = nullptr;     ///< Registered key callback.

  [[nodiscard]] bool isClick(const core::MousePos &start,
                             const core::MousePos &end,
                             int threshold = 4) const;
};

} // namespace gambit::controller
