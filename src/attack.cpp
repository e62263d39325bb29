#include "chessync/attack.hpp"
#include "chessync/types.hpp"
#include "chessync/board.hpp"
#include <cstdlib>

namespace chessync {

static inline int sign(int v) { return (v > 0) - (v < 0); }

bool path_clear(const Board& b, Coord a, Coord c) {
  const int df = sign(c.file - a.file);
  const int dr = sign(c.rank - a.rank);
  Coord q{ a.file + df, a.rank + dr };
  while (q != c) {
    if (b.occupied(q)) return false;
    q.file += df; q.rank += dr;
  }
  return true;
}

bool attacks(const Board& b, const Piece& attacker, Coord s) {
  const int df = s.file - attacker.pos.file;
  const int dr = s.rank - attacker.pos.rank;
  const int adf = std::abs(df), adr = std::abs(dr);
  if (!df && !dr) return false;

  switch (attacker.kind) {
    case PieceKind::Pawn:
      return adf == 1 && dr == forward(attacker.color);
    case PieceKind::Knight:
      return (adf == 1 && adr == 2) || (adf == 2 && adr == 1);
    case PieceKind::Bishop:
      return adf == adr && path_clear(b, attacker.pos, s);
    case PieceKind::Rook:
      return (df == 0 || dr == 0) && path_clear(b, attacker.pos, s);
    case PieceKind::Queen:
      return (adf == adr || df == 0 || dr == 0) && path_clear(b, attacker.pos, s);
    case PieceKind::King:
      return adf <= 1 && adr <= 1;
  }
  return false;
}

bool square_attacked(const Board& b, Coord s, Color by) {
  for (int i = 0; i < SQUARE_N; ++i) {
    const Piece* p = b.piece_at(coord_of(i));
    if (p && p->color == by && attacks(b, *p, s)) return true;
  }
  return false;
}

bool is_in_check(const Board& b, Color side) {
  const auto ks = b.find_king(side);
  if (!ks) return false; // no king, nothing to attack
  return square_attacked(b, *ks, other(side));
}

} // namespace chessync
