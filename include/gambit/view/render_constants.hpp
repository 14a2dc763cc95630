#pragma once
#include <SFML/Graphics/Color.hpp>
#include <algorithm>
#include <string>

#include "../constants.hpp"

namespace gambit::view::constant {
constexpr unsigned int BOARD_SIZE = 8;
// Distance between the window border and the board on each side
inline constexpr unsigned int WINDOW_MARGIN = 20;
inline constexpr unsigned int STATUS_BAR_HEIGHT = 60;
inline constexpr unsigned int MIN_BOARD_PX_SIZE = 160;

inline unsigned int BOARD_PX_SIZE = 640;  // Board edge length
inline unsigned int SQUARE_PX_SIZE = BOARD_PX_SIZE / BOARD_SIZE;
inline unsigned int BOARD_OFFSET_X = WINDOW_MARGIN;
inline unsigned int BOARD_OFFSET_Y = WINDOW_MARGIN;
inline unsigned int WINDOW_WIDTH = BOARD_PX_SIZE + 2 * WINDOW_MARGIN;
inline unsigned int WINDOW_HEIGHT = BOARD_PX_SIZE + 2 * WINDOW_MARGIN + STATUS_BAR_HEIGHT;

inline float HIGHLIGHT_THICKNESS = 4.f;
inline float GLYPH_SCALE = 0.8f;  // glyph height relative to a square

inline const sf::Color COL_BACKGROUND(48, 46, 43);
inline const sf::Color COL_LIGHT_SQUARE(240, 217, 181);
inline const sf::Color COL_DARK_SQUARE(181, 136, 99);
inline const sf::Color COL_SELECT_BORDER(40, 170, 60);
inline const sf::Color COL_TARGET_BORDER(235, 200, 30);
inline const sf::Color COL_PIECE(20, 20, 20);
inline const sf::Color COL_TEXT(230, 230, 230);
inline const sf::Color COL_BUTTON(80, 78, 74);
inline const sf::Color COL_BUTTON_HOVER(104, 101, 96);
inline const sf::Color COL_BORDER(120, 118, 112);

const std::string STR_WINDOW_TITLE = "Gambit";
// DejaVu Sans carries the chess glyphs; override with --font elsewhere
const std::string STR_FILE_PATH_FONT = "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf";
const std::string STR_RESET_LABEL = "Reset";

inline void updateBoardSize(unsigned int boardPx) {
  boardPx = std::max(boardPx, MIN_BOARD_PX_SIZE);
  SQUARE_PX_SIZE = boardPx / BOARD_SIZE;
  BOARD_PX_SIZE = SQUARE_PX_SIZE * BOARD_SIZE;
  BOARD_OFFSET_X = WINDOW_MARGIN;
  BOARD_OFFSET_Y = WINDOW_MARGIN;
  WINDOW_WIDTH = BOARD_PX_SIZE + 2 * WINDOW_MARGIN;
  WINDOW_HEIGHT = BOARD_PX_SIZE + 2 * WINDOW_MARGIN + STATUS_BAR_HEIGHT;
}

}  // namespace gambit::view::constant
