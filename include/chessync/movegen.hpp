#pragma once
#include <vector>
#include "chessync/board.hpp"
#include "chessync/movelist.hpp"


namespace chessync {


// Squares `p` may legally move to on `b`. Candidates are produced per kind
// and filtered through check_move, so the result always agrees with the
// validator.
std::vector<Coord> legal_destinations(const Board& b, const Piece& p);


// Every legal move of `side`. Pawn moves onto the last rank are listed once,
// promoting to a queen.
void generate_legal(const Board& b, Color side, MoveList& out);


} // namespace chessync
