#pragma once
#include "chessync/move.hpp"
#include "chessync/board.hpp"

namespace chessync {

// Executes an already-validated move. The new position is built on a copy and
// swapped in at the end, so `b` is never seen half-updated.
// Throws std::invalid_argument if `from` is empty or off the board.
MoveRecord apply_move(Board& b, const Move& m);

inline MoveRecord apply_move(Board& b, Coord from, Coord to, PieceKind promo = PieceKind::Queen) {
  return apply_move(b, Move{ from, to, promo });
}

} // namespace chessync
