#include "chessync/codec.hpp"
#include <cctype>

namespace chessync {

static inline char flag_char(bool v) { return v ? '1' : '0'; }

static inline bool flag_from_char(char c, const char* field) {
  if (c == '0') return false;
  if (c == '1') return true;
  throw DecodeError(std::string("Invalid ") + field + " flag '" + c + "'");
}

char kind_to_char(PieceKind k) {
  static constexpr char K[] = "pnbrqk";
  return K[static_cast<int>(k)];
}

PieceKind kind_from_char(char c) {
  switch (std::tolower(static_cast<unsigned char>(c))) {
    case 'p': return PieceKind::Pawn;
    case 'n': return PieceKind::Knight;
    case 'b': return PieceKind::Bishop;
    case 'r': return PieceKind::Rook;
    case 'q': return PieceKind::Queen;
    case 'k': return PieceKind::King;
    default:  throw DecodeError(std::string("Invalid piece kind '") + c + "'");
  }
}

std::string coord_to_string(Coord c) {
  std::string s;
  s.push_back(char('a' + c.file));
  s.push_back(char('1' + c.rank));
  return s;
}

Coord coord_from_string(std::string_view s) {
  if (s.size() != 2) throw std::invalid_argument("bad coordinate length");
  const char f = s[0];
  const char r = s[1];
  if (f < 'a' || f > 'h' || r < '1' || r > '8')
    throw std::invalid_argument("bad square");
  return Coord{ f - 'a', r - '1' };
}

std::string encode(const Board& b) {
  std::string out;
  out.reserve(static_cast<std::size_t>(b.piece_count()) * RECORD_LEN);
  for (int f = 0; f < 8; ++f) {
    for (int r = 0; r < 8; ++r) {
      const Piece* p = b.piece_at(Coord{ f, r });
      if (!p) continue;
      out.push_back(kind_to_char(p->kind));
      out.push_back(p->color == Color::Light ? '0' : '1');
      out += coord_to_string(p->pos);
      out.push_back(flag_char(p->is_en_passant_target));
      out.push_back(flag_char(p->has_not_moved));
    }
  }
  return out;
}

Board decode(std::string_view text) {
  if (text.size() % RECORD_LEN != 0)
    throw DecodeError("Encoded board length " + std::to_string(text.size()) +
                      " is not a multiple of 6");

  Board b;
  for (std::size_t i = 0; i < text.size(); i += RECORD_LEN) {
    const std::string_view rec = text.substr(i, RECORD_LEN);

    Piece p;
    p.kind = kind_from_char(rec[0]);

    if (rec[1] == '0') p.color = Color::Light;
    else if (rec[1] == '1') p.color = Color::Dark;
    else throw DecodeError(std::string("Invalid color '") + rec[1] + "'");

    try {
      p.pos = coord_from_string(rec.substr(2, 2));
    } catch (const std::invalid_argument&) {
      throw DecodeError("Invalid square '" + std::string(rec.substr(2, 2)) + "'");
    }

    p.is_en_passant_target = flag_from_char(rec[4], "en-passant");
    p.has_not_moved        = flag_from_char(rec[5], "has-not-moved");

    if (b.occupied(p.pos))
      throw DecodeError("Square " + coord_to_string(p.pos) + " encoded twice");
    b.put(p);
  }
  return b;
}

bool try_decode(std::string_view text, Board& out, std::string* err) {
  try {
    out = decode(text);
    return true;
  } catch (const DecodeError& e) {
    if (err) *err = e.what();
    return false;
  }
}

} // namespace chessync
