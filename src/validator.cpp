#include "chessync/validator.hpp"
#include "chessync/attack.hpp"
#include <cstdlib>

namespace chessync {

namespace {

Verdict check_pawn(const Board& b, const Piece& p, Coord to) {
  const int dir = forward(p.color);
  const int df = to.file - p.pos.file;
  const int dr = to.rank - p.pos.rank;

  if (df == 0) {
    if (dr == dir) return b.occupied(to) ? Verdict::Obstructed : Verdict::Legal;
    if (dr == 2 * dir && p.has_not_moved) {
      const Coord mid{ p.pos.file, p.pos.rank + dir };
      return (b.occupied(mid) || b.occupied(to)) ? Verdict::Obstructed : Verdict::Legal;
    }
    return Verdict::BadPattern;
  }

  if (std::abs(df) == 1 && dr == dir) {
    if (b.occupied(to)) return Verdict::Legal; // own pieces already excluded
    const Piece* behind = b.piece_at(Coord{ to.file, to.rank - dir });
    if (behind && behind->kind == PieceKind::Pawn && behind->color != p.color &&
        behind->is_en_passant_target)
      return Verdict::Legal;
  }
  return Verdict::BadPattern;
}

Verdict check_castle(const Board& b, const Piece& king, Coord to) {
  if (!king.has_not_moved) return Verdict::CastleDenied;

  const int step = to.file > king.pos.file ? +1 : -1;
  const Piece* rook = b.piece_at(Coord{ step > 0 ? 7 : 0, king.pos.rank });
  if (!rook || rook->kind != PieceKind::Rook || rook->color != king.color || !rook->has_not_moved)
    return Verdict::CastleDenied;
  if (!path_clear(b, king.pos, rook->pos)) return Verdict::CastleDenied;
  if (is_in_check(b, king.color)) return Verdict::CastleDenied;

  const Coord through{ king.pos.file + step, king.pos.rank };
  if (exposes_king(b, king, through)) return Verdict::CastleDenied;
  return Verdict::Legal;
}

Verdict check_shape(const Board& b, const Piece& p, Coord to) {
  const int df = to.file - p.pos.file;
  const int dr = to.rank - p.pos.rank;
  const int adf = std::abs(df), adr = std::abs(dr);

  switch (p.kind) {
    case PieceKind::Pawn:
      return check_pawn(b, p, to);
    case PieceKind::Knight:
      return ((adf == 1 && adr == 2) || (adf == 2 && adr == 1)) ? Verdict::Legal : Verdict::BadPattern;
    case PieceKind::Bishop:
      if (adf != adr) return Verdict::BadPattern;
      return path_clear(b, p.pos, to) ? Verdict::Legal : Verdict::Obstructed;
    case PieceKind::Rook:
      if (df != 0 && dr != 0) return Verdict::BadPattern;
      return path_clear(b, p.pos, to) ? Verdict::Legal : Verdict::Obstructed;
    case PieceKind::Queen:
      if (adf != adr && df != 0 && dr != 0) return Verdict::BadPattern;
      return path_clear(b, p.pos, to) ? Verdict::Legal : Verdict::Obstructed;
    case PieceKind::King:
      if (adf <= 1 && adr <= 1) return Verdict::Legal;
      if (dr == 0 && adf == 2) return check_castle(b, p, to);
      return Verdict::BadPattern;
  }
  return Verdict::BadPattern;
}

} // namespace

std::string_view to_string(Verdict v) {
  switch (v) {
    case Verdict::Legal:        return "legal";
    case Verdict::NoPiece:      return "no-piece";
    case Verdict::OffBoard:     return "off-board";
    case Verdict::NoMovement:   return "no-movement";
    case Verdict::SelfCapture:  return "self-capture";
    case Verdict::ExposesKing:  return "exposes-king";
    case Verdict::BadPattern:   return "bad-pattern";
    case Verdict::Obstructed:   return "obstructed";
    case Verdict::CastleDenied: return "castle-denied";
  }
  return "unknown";
}

bool exposes_king(const Board& b, const Piece& piece, Coord to) {
  Board what_if = b.snapshot();
  what_if.take(piece.pos);
  Piece moved = piece;
  moved.pos = to;
  what_if.put(moved);
  return is_in_check(what_if, piece.color);
}

Verdict check_move(const Board& b, const Piece& piece, Coord to) {
  if (!on_board(to)) return Verdict::OffBoard;
  if (to == piece.pos) return Verdict::NoMovement;

  const Piece* target = b.piece_at(to);
  if (target && target->color == piece.color) return Verdict::SelfCapture;

  if (exposes_king(b, piece, to)) return Verdict::ExposesKing;

  return check_shape(b, piece, to);
}

Verdict check_move(const Board& b, Coord from, Coord to) {
  const Piece* p = b.piece_at(from);
  if (!p) return Verdict::NoPiece;
  return check_move(b, *p, to);
}

} // namespace chessync
