#include "gambit/view/status_text.hpp"

namespace gambit::view {

std::string colorName(core::Color c) {
  return c == core::Color::White ? "White" : "Black";
}

std::string statusText(const model::GameStatus& status) {
  switch (status.phase) {
    case core::GameResult::CHECKMATE:
      return colorName(status.sideToMove) + " is in checkmate. " + colorName(~status.sideToMove) +
             " wins!";
    case core::GameResult::STALEMATE:
      return "Stalemate. Draw.";
    default:
      break;
  }
  std::string s = colorName(status.sideToMove) + " to move";
  if (status.inCheck) s += " (Check)";
  return s;
}

}  // namespace gambit::view
