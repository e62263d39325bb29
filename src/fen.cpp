#include "chessync/fen.hpp"
#include "chessync/codec.hpp"
#include <cctype>
#include <sstream>
#include <string>

namespace chessync {

static inline bool is_digit(char c) { return c >= '0' && c <= '9'; }

static inline char piece_to_char(const Piece& p) {
  const char c = kind_to_char(p.kind);
  return p.color == Color::Light ? char(std::toupper(static_cast<unsigned char>(c))) : c;
}

// Standard starting square of a non-pawn piece, used to guess has_not_moved.
static bool on_start_square(const Piece& p) {
  static constexpr PieceKind BACK[8] = {
    PieceKind::Rook, PieceKind::Knight, PieceKind::Bishop, PieceKind::Queen,
    PieceKind::King, PieceKind::Bishop, PieceKind::Knight, PieceKind::Rook
  };
  if (p.kind == PieceKind::Pawn) return p.pos.rank == pawn_rank(p.color);
  return p.pos.rank == home_rank(p.color) && BACK[p.pos.file] == p.kind;
}

static bool unmoved_at(const Board& b, Coord c, Color col, PieceKind k) {
  const Piece* p = b.piece_at(c);
  return p && p->color == col && p->kind == k && p->has_not_moved;
}

Color set_from_fen(Board& b, std::string_view fen) {
  b.clear();

  std::string fen_str(fen);
  std::istringstream ss(fen_str);
  std::string placement, active = "w", castling = "-", ep = "-";
  if (!(ss >> placement)) throw FenError("Malformed FEN: missing placement field");
  ss >> active >> castling >> ep; // optional

  // 1) Piece placement
  int r = 7, f = 0;
  for (char ch : placement) {
    if (ch == '/') { --r; f = 0; continue; }
    if (is_digit(ch)) { f += ch - '0'; continue; }
    Piece p;
    try {
      p.kind = kind_from_char(ch);
    } catch (const DecodeError&) {
      throw FenError("Invalid piece character in FEN");
    }
    p.color = std::isupper(static_cast<unsigned char>(ch)) ? Color::Light : Color::Dark;
    if (f < 0 || f > 7 || r < 0 || r > 7) throw FenError("Square out of range while parsing FEN");
    p.pos = Coord{ f, r };
    p.has_not_moved = p.kind != PieceKind::King && p.kind != PieceKind::Rook && on_start_square(p);
    b.put(p);
    ++f;
  }

  // 2) Active color
  Color side;
  if (active == "w") side = Color::Light;
  else if (active == "b") side = Color::Dark;
  else throw FenError("Invalid active color in FEN");

  // 3) Castling rights -> unmoved king and corner rooks
  if (castling != "-") {
    for (char cch : castling) {
      Color col;
      int rook_file;
      if (cch == 'K')      { col = Color::Light; rook_file = 7; }
      else if (cch == 'Q') { col = Color::Light; rook_file = 0; }
      else if (cch == 'k') { col = Color::Dark;  rook_file = 7; }
      else if (cch == 'q') { col = Color::Dark;  rook_file = 0; }
      else throw FenError("Invalid castling char in FEN");

      const int rank = home_rank(col);
      auto king = b.take(Coord{ 4, rank });
      if (king) {
        if (king->kind == PieceKind::King && king->color == col) king->has_not_moved = true;
        b.put(*king);
      }
      auto rook = b.take(Coord{ rook_file, rank });
      if (rook) {
        if (rook->kind == PieceKind::Rook && rook->color == col) rook->has_not_moved = true;
        b.put(*rook);
      }
    }
  }

  // 4) En-passant square -> flag the pawn that just passed it
  if (ep != "-") {
    Coord sq;
    try {
      sq = coord_from_string(ep);
    } catch (const std::invalid_argument&) {
      throw FenError("Invalid en-passant square in FEN");
    }
    const Color mover = other(side);
    auto pawn = b.take(Coord{ sq.file, sq.rank + forward(mover) });
    if (!pawn || pawn->kind != PieceKind::Pawn || pawn->color != mover) {
      if (pawn) b.put(*pawn);
      throw FenError("En-passant square without a matching pawn");
    }
    pawn->is_en_passant_target = true;
    pawn->has_not_moved = false;
    b.put(*pawn);
  }

  return side;
}

std::string to_fen(const Board& b, Color side_to_move) {
  std::string out;

  // 1) Piece placement
  for (int r = 7; r >= 0; --r) {
    int empties = 0;
    for (int f = 0; f < 8; ++f) {
      const Piece* p = b.piece_at(Coord{ f, r });
      if (!p) {
        ++empties;
      } else {
        if (empties) { out += char('0' + empties); empties = 0; }
        out += piece_to_char(*p);
      }
    }
    if (empties) out += char('0' + empties);
    if (r) out += '/';
  }
  out += ' ';

  // 2) Active color
  out += (side_to_move == Color::Light ? 'w' : 'b');
  out += ' ';

  // 3) Castling, derived from unmoved pieces
  std::string cr;
  for (Color col : {Color::Light, Color::Dark}) {
    const int rank = home_rank(col);
    if (!unmoved_at(b, Coord{ 4, rank }, col, PieceKind::King)) continue;
    const bool light = col == Color::Light;
    if (unmoved_at(b, Coord{ 7, rank }, col, PieceKind::Rook)) cr += light ? 'K' : 'k';
    if (unmoved_at(b, Coord{ 0, rank }, col, PieceKind::Rook)) cr += light ? 'Q' : 'q';
  }
  out += cr.empty() ? std::string("-") : cr;
  out += ' ';

  // 4) En-passant square
  std::string ep = "-";
  b.for_each_piece([&](const Piece& p) {
    if (p.kind == PieceKind::Pawn && p.is_en_passant_target)
      ep = coord_to_string(Coord{ p.pos.file, p.pos.rank - forward(p.color) });
  });
  out += ep;

  // 5) Halfmove & 6) Fullmove are not tracked
  out += " 0 1";

  return out;
}

} // namespace chessync
