#pragma once
#include <array>
#include <optional>
#include "chessync/types.hpp"


namespace chessync {


struct Piece {
PieceKind kind = PieceKind::Pawn;
Color color = Color::Light;
Coord pos{};
bool has_not_moved = true;
bool is_en_passant_target = false;
};


inline bool operator==(const Piece& a, const Piece& b) {
return a.kind == b.kind && a.color == b.color && a.pos == b.pos &&
       a.has_not_moved == b.has_not_moved && a.is_en_passant_target == b.is_en_passant_target;
}
inline bool operator!=(const Piece& a, const Piece& b) { return !(a == b); }


// 64 square slots with value semantics: copying a Board is a full snapshot.
class Board {
public:
Board() = default;

static Board empty() { return Board{}; }
static Board standard_setup();

Board snapshot() const { return *this; }
void clear();

std::optional<Piece> occupant_at(Coord c) const;
// nullptr when empty or off the board
const Piece* piece_at(Coord c) const;
bool occupied(Coord c) const { return piece_at(c) != nullptr; }

// Overwrites whatever stands on p.pos
void put(const Piece& p);
std::optional<Piece> take(Coord c);

void clear_en_passant_targets();
std::optional<Coord> find_king(Color c) const;
int piece_count() const;

U64 hash() const;

template <class F>
void for_each_piece(F&& f) const {
  for (const auto& sq : squares_) if (sq) f(*sq);
}

friend bool operator==(const Board& a, const Board& b) { return a.squares_ == b.squares_; }
friend bool operator!=(const Board& a, const Board& b) { return !(a == b); }

private:
// indexed by rank * 8 + file
std::array<std::optional<Piece>, SQUARE_N> squares_{};
};


} // namespace chessync
