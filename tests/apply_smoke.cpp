#include <cassert>
#include <stdexcept>
#include "chessync/apply.hpp"
#include "chessync/board.hpp"
#include "chessync/codec.hpp"
#include "chessync/fen.hpp"
#include "chessync/move.hpp"

int main() {
  using namespace chessync;
  auto at = [](const char* s) { return coord_from_string(s); };

  // Double push flags the pawn; the reply clears it and flags its own
  {
    Board b = Board::standard_setup();
    const MoveRecord r1 = apply_move(b, at("e2"), at("e4"));
    assert(r1.moved == PieceKind::Pawn);
    assert(has_flag(r1.flags, MoveFlag::DoublePush));
    assert(!r1.captured);
    const Piece* p = b.piece_at(at("e4"));
    assert(p && p->is_en_passant_target && !p->has_not_moved);
    assert(!b.occupied(at("e2")));

    apply_move(b, at("e7"), at("e5"));
    assert(!b.piece_at(at("e4"))->is_en_passant_target);
    assert(b.piece_at(at("e5"))->is_en_passant_target);

    // a single step never flags, and the mover's old flag goes too
    apply_move(b, at("d2"), at("d3"));
    assert(!b.piece_at(at("e5"))->is_en_passant_target);
    assert(!b.piece_at(at("d3"))->is_en_passant_target);
  }

  // Plain capture
  {
    Board b;
    set_from_fen(b, "4k3/8/8/3p4/4P3/8/8/4K3 w - - 0 1");
    const MoveRecord r = apply_move(b, at("e4"), at("d5"));
    assert(has_flag(r.flags, MoveFlag::Capture));
    assert(!has_flag(r.flags, MoveFlag::EnPassant));
    assert(r.captured && r.captured->color == Color::Dark);
    assert(b.piece_count() == 3);
    assert(b.piece_at(at("d5"))->color == Color::Light);
  }

  // Non-pawn moves lose has_not_moved
  {
    Board b = Board::standard_setup();
    apply_move(b, at("g1"), at("f3"));
    const Piece* n = b.piece_at(at("f3"));
    assert(n && n->kind == PieceKind::Knight && !n->has_not_moved);
  }

  // Promotion: queen by default, the requested piece otherwise
  {
    Board b;
    set_from_fen(b, "4k3/P7/8/8/8/8/7p/4K3 w - - 0 1");
    Board q = b;
    const MoveRecord r = apply_move(q, at("a7"), at("a8"));
    assert(has_flag(r.flags, MoveFlag::Promotion));
    assert(q.piece_at(at("a8"))->kind == PieceKind::Queen);

    Board n = b;
    apply_move(n, at("a7"), at("a8"), PieceKind::Knight);
    assert(n.piece_at(at("a8"))->kind == PieceKind::Knight);

    Board d = b;
    apply_move(d, at("h2"), at("h1"), PieceKind::Rook);
    const Piece* rook = d.piece_at(at("h1"));
    assert(rook && rook->kind == PieceKind::Rook && rook->color == Color::Dark);

    // kings and pawns are not promotion targets
    Board k = b;
    apply_move(k, at("a7"), at("a8"), PieceKind::King);
    assert(k.piece_at(at("a8"))->kind == PieceKind::Queen);
  }

  // Nothing to move: throws and leaves the board alone
  {
    Board b = Board::standard_setup();
    const Board before = b;
    bool threw = false;
    try {
      apply_move(b, at("e4"), at("e5"));
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    assert(threw);
    assert(b == before);

    threw = false;
    try {
      const Coord off{ 4, 8 };
      apply_move(b, at("e7"), off);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    assert(threw);
    assert(b == before);
  }

  return 0;
}
