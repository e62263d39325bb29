#include "chessync/apply.hpp"
#include <cstdlib>
#include <stdexcept>
#include <utility>

namespace chessync {

static inline bool promotable(PieceKind k) {
  return k == PieceKind::Knight || k == PieceKind::Bishop ||
         k == PieceKind::Rook   || k == PieceKind::Queen;
}

MoveRecord apply_move(Board& b, const Move& m) {
  Board next = b.snapshot();

  auto moving = next.take(m.from);
  if (!moving) throw std::invalid_argument("apply_move: no piece on origin square");
  if (!on_board(m.to)) throw std::invalid_argument("apply_move: destination off the board");

  MoveRecord rec;
  rec.move  = m;
  rec.moved = moving->kind;

  const Color us = moving->color;
  const int df = m.to.file - m.from.file;
  const int dr = m.to.rank - m.from.rank;

  // (a) plain capture
  {
    const Piece* dst = next.piece_at(m.to);
    if (dst && dst->color != us) {
      rec.captured = next.take(m.to);
      rec.flags = rec.flags | MoveFlag::Capture;
    }
  }

  // (b) en passant: diagonal pawn step onto an empty square
  if (moving->kind == PieceKind::Pawn && df != 0 && !rec.captured) {
    const Coord behind{ m.to.file, m.to.rank - forward(us) };
    const Piece* victim = next.piece_at(behind);
    if (victim && victim->kind == PieceKind::Pawn && victim->color != us) {
      rec.captured = next.take(behind);
      rec.flags = rec.flags | MoveFlag::Capture | MoveFlag::EnPassant;
    }
  }

  // (c) the en-passant window lasts one move
  next.clear_en_passant_targets();
  moving->is_en_passant_target = false;

  // (d) double push opens it again
  if (moving->kind == PieceKind::Pawn && std::abs(dr) == 2 && df == 0) {
    moving->is_en_passant_target = true;
    rec.flags = rec.flags | MoveFlag::DoublePush;
  }

  // (e) castling drags the corner rook next to the king
  if (moving->kind == PieceKind::King && std::abs(df) == 2 && dr == 0) {
    const int step = df > 0 ? +1 : -1;
    auto rook = next.take(Coord{ step > 0 ? 7 : 0, m.from.rank });
    if (!rook) throw std::invalid_argument("apply_move: castling without a corner rook");
    rook->pos = Coord{ m.to.file - step, m.to.rank };
    rook->has_not_moved = false;
    next.put(*rook);
    rec.flags = rec.flags | MoveFlag::Castle;
  }

  // (f) relocate
  moving->pos = m.to;
  moving->has_not_moved = false;
  if (moving->kind == PieceKind::Pawn && m.to.rank == last_rank(us)) {
    moving->kind = promotable(m.promo) ? m.promo : PieceKind::Queen;
    rec.flags = rec.flags | MoveFlag::Promotion;
  }
  next.put(*moving);

  b = std::move(next);
  return rec;
}

} // namespace chessync
