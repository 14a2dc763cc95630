#include "gambit/model/perft.hpp"

#include "gambit/model/move_validator.hpp"

namespace gambit::model {

namespace {

std::uint64_t perftRec(const MoveValidator& v, const Position& pos, int depth) {
  std::vector<Move> moves;
  v.legalMoves(pos, moves);
  if (depth == 1) return moves.size();

  std::uint64_t nodes = 0;
  for (const auto& m : moves) {
    Position next = pos;
    next.doMove(m);
    nodes += perftRec(v, next, depth - 1);
  }
  return nodes;
}

}  // namespace

std::uint64_t perft(const Position& pos, int depth) {
  if (depth <= 0) return 1;
  const MoveValidator v{};
  return perftRec(v, pos, depth);
}

void perftDivide(const Position& pos, int depth,
                 std::vector<std::pair<Move, std::uint64_t>>& out) {
  out.clear();
  if (depth <= 0) return;
  const MoveValidator v{};
  std::vector<Move> moves;
  v.legalMoves(pos, moves);
  for (const auto& m : moves) {
    Position next = pos;
    next.doMove(m);
    out.emplace_back(m, depth == 1 ? 1 : perftRec(v, next, depth - 1));
  }
}

}  // namespace gambit::model
