#include "chessync/movegen.hpp"
#include "chessync/validator.hpp"
#include "chessync/types.hpp"
#include "chessync/board.hpp"

namespace chessync {

static constexpr int KN_DF[8] = {+1, +2, +2, +1, -1, -2, -2, -1};
static constexpr int KN_DR[8] = {+2, +1, -1, -2, -2, -1, +1, +2};

static constexpr int DFb[4] = {+1, +1, -1, -1};
static constexpr int DRb[4] = {+1, -1, +1, -1};

static constexpr int DFr[4] = {+1, -1,  0,  0}; // E, W,  -,  -
static constexpr int DRr[4] = { 0,  0, +1, -1}; // -,  -,  N,  S

static void add_if_legal(const Board& b, const Piece& p, Coord t, std::vector<Coord>& out) {
  if (on_board(t) && is_move_legal(b, p, t)) out.push_back(t);
}

// Walk each ray until the first occupied square (kept, it may be a capture).
static void add_rays(const Board& b, const Piece& p, const int* DF, const int* DR,
                     std::vector<Coord>& out) {
  for (int dir = 0; dir < 4; ++dir) {
    Coord t{ p.pos.file + DF[dir], p.pos.rank + DR[dir] };
    while (on_board(t)) {
      add_if_legal(b, p, t, out);
      if (b.occupied(t)) break; // blocked
      t.file += DF[dir]; t.rank += DR[dir];
    }
  }
}

std::vector<Coord> legal_destinations(const Board& b, const Piece& p) {
  std::vector<Coord> out;
  const int f0 = p.pos.file, r0 = p.pos.rank;

  switch (p.kind) {
    case PieceKind::Pawn: {
      const int dir = forward(p.color);
      add_if_legal(b, p, Coord{ f0, r0 + dir }, out);
      add_if_legal(b, p, Coord{ f0, r0 + 2 * dir }, out);
      add_if_legal(b, p, Coord{ f0 - 1, r0 + dir }, out);
      add_if_legal(b, p, Coord{ f0 + 1, r0 + dir }, out);
      break;
    }
    case PieceKind::Knight:
      for (int i = 0; i < 8; ++i) add_if_legal(b, p, Coord{ f0 + KN_DF[i], r0 + KN_DR[i] }, out);
      break;
    case PieceKind::Bishop:
      add_rays(b, p, DFb, DRb, out);
      break;
    case PieceKind::Rook:
      add_rays(b, p, DFr, DRr, out);
      break;
    case PieceKind::Queen:
      add_rays(b, p, DFb, DRb, out);
      add_rays(b, p, DFr, DRr, out);
      break;
    case PieceKind::King:
      for (int df = -1; df <= 1; ++df) for (int dr = -1; dr <= 1; ++dr) {
        if (!df && !dr) continue;
        add_if_legal(b, p, Coord{ f0 + df, r0 + dr }, out);
      }
      add_if_legal(b, p, Coord{ f0 + 2, r0 }, out);
      add_if_legal(b, p, Coord{ f0 - 2, r0 }, out);
      break;
  }
  return out;
}

void generate_legal(const Board& b, Color side, MoveList& out) {
  out.clear();
  for (int s = 0; s < SQUARE_N; ++s) {
    const Piece* p = b.piece_at(coord_of(s));
    if (!p || p->color != side) continue;
    for (const Coord& t : legal_destinations(b, *p))
      out.push(Move{ p->pos, t, PieceKind::Queen });
  }
}

} // namespace chessync
