#include "gambit/view/font_table.hpp"

#include <stdexcept>

namespace gambit::view {

FontTable& FontTable::getInstance() {
  static FontTable instance;
  return instance;
}

FontTable::FontTable() = default;

FontTable::~FontTable() = default;

void FontTable::preLoad(const std::string& path) {
  (void)get(path);
}

[[nodiscard]] const sf::Font& FontTable::get(const std::string& path) {
  auto it = m_fonts.find(path);
  if (it != m_fonts.end()) return it->second;

  sf::Font font;
  if (!font.loadFromFile(path)) {
    throw std::runtime_error("Error when loading font: " + path);
  }
  m_fonts[path] = std::move(font);
  return m_fonts[path];
}

}  // namespace gambit::view
