#pragma once

#include <SFML/Graphics/Font.hpp>
#include <string>
#include <unordered_map>

namespace gambit::view {

// Process-wide cache of loaded fonts, keyed by file path.
class FontTable {
 public:
  static FontTable& getInstance();

  // Loads on first use; throws std::runtime_error if the file cannot be read.
  [[nodiscard]] const sf::Font& get(const std::string& path);

  void preLoad(const std::string& path);

 private:
  FontTable();
  ~FontTable();
  FontTable(const FontTable&) = delete;
  FontTable& operator=(const FontTable&) = delete;

  std::unordered_map<std::string, sf::Font> m_fonts;
};

}  // namespace gambit::view
