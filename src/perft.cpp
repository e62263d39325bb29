#include "chessync/perft.hpp"
#include "chessync/movegen.hpp"
#include "chessync/apply.hpp"
#include <vector>

namespace chessync {

std::uint64_t perft(const Board& b, Color side, int depth) {
  if (depth == 0) return 1ULL;

  MoveList ml;
  generate_legal(b, side, ml);
  if (depth == 1) return ml.size();

  std::uint64_t nodes = 0ULL;
  for (const auto& m : ml) {
    Board child = b;
    apply_move(child, m);
    nodes += perft(child, other(side), depth - 1);
  }
  return nodes;
}

void perft_divide(const Board& b, Color side, int depth,
                  std::vector<std::pair<Move, std::uint64_t>>& out) {
  out.clear();
  if (depth <= 0) return;

  MoveList ml;
  generate_legal(b, side, ml);
  for (const auto& m : ml) {
    Board child = b;
    apply_move(child, m);
    out.emplace_back(m, perft(child, other(side), depth - 1));
  }
}

} // namespace chessync
