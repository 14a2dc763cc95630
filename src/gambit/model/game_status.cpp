#include "gambit/model/game_status.hpp"

#include "gambit/model/attack_detector.hpp"
#include "gambit/model/move_validator.hpp"

namespace gambit::model {

GameStatus evaluateGameState(const Position& pos) {
  GameStatus st;
  st.sideToMove = pos.sideToMove();
  st.inCheck = isKingInCheck(pos.getBoard(), st.sideToMove);

  const MoveValidator validator{};
  if (validator.hasAnyLegalMove(pos, st.sideToMove))
    st.phase = core::GameResult::ONGOING;
  else
    st.phase = st.inCheck ? core::GameResult::CHECKMATE : core::GameResult::STALEMATE;
  return st;
}

}  // namespace gambit::model
