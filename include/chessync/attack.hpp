#pragma once
#include "chessync/board.hpp"

namespace chessync {

// True if no piece stands strictly between a and b. a and b must share a
// rank, file or diagonal.
bool path_clear(const Board& b, Coord a, Coord c);

// Does `attacker` (standing on attacker.pos) attack square s?
bool attacks(const Board& b, const Piece& attacker, Coord s);

// Is square s attacked by any piece of side 'by'?
bool square_attacked(const Board& b, Coord s, Color by);

// Is 'side' currently in check? A side without a king is never in check.
bool is_in_check(const Board& b, Color side);

} // namespace chessync
