#include <cassert>
#include "chessync/apply.hpp"
#include "chessync/board.hpp"
#include "chessync/codec.hpp"
#include "chessync/fen.hpp"
#include "chessync/move.hpp"
#include "chessync/validator.hpp"

using namespace chessync;

static Coord at(const char* s) { return coord_from_string(s); }

static Verdict verdict(const char* fen, const char* from, const char* to) {
  Board b; set_from_fen(b, fen);
  return check_move(b, at(from), at(to));
}

int main() {
  // Both sides have both castles available
  {
    const char* fen = "r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1";
    assert(verdict(fen, "e1", "g1") == Verdict::Legal);
    assert(verdict(fen, "e1", "c1") == Verdict::Legal);
    assert(verdict(fen, "e8", "g8") == Verdict::Legal);
    assert(verdict(fen, "e8", "c8") == Verdict::Legal);
  }

  // Applying moves king and rook together and clears both flags
  {
    Board b; set_from_fen(b, "r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1");
    const Board before = b;
    const MoveRecord rec = apply_move(b, at("e1"), at("g1"));
    assert(has_flag(rec.flags, MoveFlag::Castle));
    assert(!rec.captured);

    const Piece* k = b.piece_at(at("g1"));
    const Piece* r = b.piece_at(at("f1"));
    assert(k && k->kind == PieceKind::King && !k->has_not_moved);
    assert(r && r->kind == PieceKind::Rook && !r->has_not_moved);
    assert(!b.occupied(at("e1")) && !b.occupied(at("h1")));
    assert(b.piece_count() == before.piece_count());
    // the earlier copy never saw half of it
    assert(before.occupied(at("e1")) && before.occupied(at("h1")));

    Board q; set_from_fen(q, "r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1");
    apply_move(q, at("e8"), at("c8"));
    assert(q.piece_at(at("c8"))->kind == PieceKind::King);
    assert(q.piece_at(at("d8"))->kind == PieceKind::Rook);
    assert(!q.piece_at(at("d8"))->has_not_moved);
    assert(!q.occupied(at("a8")));
  }

  // Kingside passes through f1, attacked by the bishop on a6
  assert(verdict("r3k2r/8/b7/8/8/8/8/R3K2R w KQkq - 0 1", "e1", "g1") == Verdict::CastleDenied);
  assert(verdict("r3k2r/8/b7/8/8/8/8/R3K2R w KQkq - 0 1", "e1", "c1") == Verdict::Legal);

  // Landing square attacked: caught by the self-check rule first
  assert(verdict("r3k1r1/8/8/8/8/8/8/R3K2R w KQq - 0 1", "e1", "g1") == Verdict::ExposesKing);

  // Not out of check
  assert(verdict("r3k2r/8/8/8/4r3/8/8/R3K2R w KQ - 0 1", "e1", "g1") == Verdict::CastleDenied);

  // Rook has moved (no K right), or is missing
  assert(verdict("r3k2r/8/8/8/8/8/8/R3K2R w Qkq - 0 1", "e1", "g1") == Verdict::CastleDenied);
  assert(verdict("r3k2r/8/8/8/8/8/8/R3K3 w KQkq - 0 1", "e1", "g1") == Verdict::CastleDenied);

  // Piece between king and rook, b1 included
  assert(verdict("r3k2r/8/8/8/8/8/8/RN2K2R w KQkq - 0 1", "e1", "c1") == Verdict::CastleDenied);
  assert(verdict("r3k2r/8/8/8/8/8/8/R3KB1R w KQkq - 0 1", "e1", "g1") == Verdict::CastleDenied);

  // King has moved and come back
  {
    Board b; set_from_fen(b, "r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1");
    apply_move(b, at("e1"), at("f1"));
    apply_move(b, at("f1"), at("e1"));
    assert(check_move(b, at("e1"), at("g1")) == Verdict::CastleDenied);
    assert(check_move(b, at("e1"), at("c1")) == Verdict::CastleDenied);
  }

  // Three files is not a castle
  assert(verdict("r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1", "e1", "b1") == Verdict::BadPattern);

  return 0;
}
