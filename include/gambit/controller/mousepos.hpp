#pragma once

#include <SFML/System/Vector2.hpp>

namespace gambit::core {
// Window pixel coordinates; may be negative or past the window edge.
using MousePos = sf::Vector2i;
}  // namespace gambit::core
