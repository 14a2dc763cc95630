#pragma once

#include <string>

#include "../model/game_status.hpp"

namespace gambit::view {

std::string colorName(core::Color c);

// Status line shown under the board, e.g. "Black to move (Check)".
std::string statusText(const model::GameStatus& status);

}  // namespace gambit::view
