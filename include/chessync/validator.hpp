#pragma once
#include <string_view>
#include "chessync/board.hpp"

namespace chessync {

// Outcome of a legality check. Only Legal permits the move; every other value
// names the first rule that failed.
enum class Verdict {
  Legal,
  NoPiece,         // nothing on the origin square
  OffBoard,        // destination outside 0..7
  NoMovement,      // destination == origin
  SelfCapture,     // own piece on the destination
  ExposesKing,     // own king attacked after the move
  BadPattern,      // not a move this kind can make
  Obstructed,      // right shape, blocked path or occupied target
  CastleDenied,    // castling preconditions not met
};

std::string_view to_string(Verdict v);

// Pure: never modifies `b`. Rules are evaluated in order and the first failure
// is returned; the self-check test runs before the per-kind shape rules.
// Castling needs an unmoved king and corner rook, an empty path between them,
// a king not currently in check and an unattacked square to pass over.
Verdict check_move(const Board& b, const Piece& piece, Coord to);
Verdict check_move(const Board& b, Coord from, Coord to);

inline bool is_move_legal(const Board& b, const Piece& piece, Coord to) {
  return check_move(b, piece, to) == Verdict::Legal;
}

// Would `piece` standing on `to` (removed from its origin) leave its king in check?
bool exposes_king(const Board& b, const Piece& piece, Coord to);

} // namespace chessync
