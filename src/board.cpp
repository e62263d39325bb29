#include "chessync/board.hpp"
#include "chessync/zobrist.hpp"


namespace chessync {


Board Board::standard_setup() {
static constexpr PieceKind BACK[8] = {
  PieceKind::Rook, PieceKind::Knight, PieceKind::Bishop, PieceKind::Queen,
  PieceKind::King, PieceKind::Bishop, PieceKind::Knight, PieceKind::Rook
};
Board b;
for (Color c : {Color::Light, Color::Dark}) {
  for (int f = 0; f < 8; ++f) {
    b.put(Piece{ BACK[f], c, Coord{ f, home_rank(c) } });
    b.put(Piece{ PieceKind::Pawn, c, Coord{ f, pawn_rank(c) } });
  }
}
return b;
}


void Board::clear() {
for (auto& sq : squares_) sq.reset();
}


std::optional<Piece> Board::occupant_at(Coord c) const {
if (!on_board(c)) return std::nullopt;
return squares_[static_cast<std::size_t>(index_of(c))];
}


const Piece* Board::piece_at(Coord c) const {
if (!on_board(c)) return nullptr;
const auto& sq = squares_[static_cast<std::size_t>(index_of(c))];
return sq ? &*sq : nullptr;
}


void Board::put(const Piece& p) {
squares_[static_cast<std::size_t>(index_of(p.pos))] = p;
}


std::optional<Piece> Board::take(Coord c) {
if (!on_board(c)) return std::nullopt;
auto& sq = squares_[static_cast<std::size_t>(index_of(c))];
std::optional<Piece> out = std::move(sq);
sq.reset();
return out;
}


void Board::clear_en_passant_targets() {
for (auto& sq : squares_) if (sq) sq->is_en_passant_target = false;
}


std::optional<Coord> Board::find_king(Color c) const {
for (const auto& sq : squares_) {
  if (sq && sq->kind == PieceKind::King && sq->color == c) return sq->pos;
}
return std::nullopt;
}


int Board::piece_count() const {
int n = 0;
for (const auto& sq : squares_) if (sq) ++n;
return n;
}


U64 Board::hash() const {
const auto& Z = Zobrist::instance();
U64 h = 0ULL;
for (int s = 0; s < SQUARE_N; ++s) {
  const auto& sq = squares_[static_cast<std::size_t>(s)];
  if (!sq) continue;
  h ^= Z.piece_on[static_cast<std::size_t>(sq->color)]
                 [static_cast<std::size_t>(sq->kind)]
                 [static_cast<std::size_t>(s)];
  if (sq->has_not_moved) h ^= Z.unmoved[static_cast<std::size_t>(s)];
  if (sq->is_en_passant_target) h ^= Z.ep_target[static_cast<std::size_t>(s)];
}
return h;
}


} // namespace chessync
