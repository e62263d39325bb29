#pragma once
#include <cstdint>


namespace chessync {


using U64 = std::uint64_t;


enum class Color : int { Light = 0, Dark = 1 };


enum class PieceKind : int { Pawn=0, Knight=1, Bishop=2, Rook=3, Queen=4, King=5 };


constexpr int COLOR_N = 2;
constexpr int KIND_N = 6;
constexpr int SQUARE_N = 64;


// (file, rank), rank 0 = Light's back rank
struct Coord {
int file = 0;
int rank = 0;
};


inline constexpr bool operator==(Coord a, Coord b) { return a.file == b.file && a.rank == b.rank; }
inline constexpr bool operator!=(Coord a, Coord b) { return !(a == b); }


inline constexpr bool on_board(Coord c) { return c.file >= 0 && c.file < 8 && c.rank >= 0 && c.rank < 8; }
inline constexpr int index_of(Coord c) { return c.rank * 8 + c.file; }
inline constexpr Coord coord_of(int idx) { return Coord{ idx & 7, idx >> 3 }; }


inline constexpr Color other(Color c) { return c == Color::Light ? Color::Dark : Color::Light; }

// Light advances toward rank 7, Dark toward rank 0
inline constexpr int forward(Color c) { return c == Color::Light ? +1 : -1; }
inline constexpr int home_rank(Color c) { return c == Color::Light ? 0 : 7; }
inline constexpr int pawn_rank(Color c) { return c == Color::Light ? 1 : 6; }
inline constexpr int last_rank(Color c) { return c == Color::Light ? 7 : 0; }


} // namespace chessync
