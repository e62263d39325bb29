#pragma once
#include <cstdint>
#include <utility>
#include <vector>
#include "chessync/types.hpp"
#include "chessync/board.hpp"
#include "chessync/movegen.hpp"

namespace chessync {

// Leaf count of the legal move tree, sides alternating from `side`.
std::uint64_t perft(const Board& b, Color side, int depth);

// Per-move breakdown at root
void perft_divide(const Board& b, Color side, int depth,
                  std::vector<std::pair<Move, std::uint64_t>>& out);

} // namespace chessync
