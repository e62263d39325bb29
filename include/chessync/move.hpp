#pragma once
#include <cstdint>
#include <optional>
#include "chessync/types.hpp"
#include "chessync/board.hpp"


namespace chessync {


enum class MoveFlag : uint8_t {
Quiet = 0,
Capture = 1 << 0,
DoublePush = 1 << 1,
EnPassant = 1 << 2,
Castle = 1 << 3,
Promotion = 1 << 4,
};


inline constexpr MoveFlag operator|(MoveFlag a, MoveFlag b) {
return static_cast<MoveFlag>(static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}
inline constexpr bool has_flag(MoveFlag set, MoveFlag f) {
return (static_cast<uint8_t>(set) & static_cast<uint8_t>(f)) != 0;
}


struct Move {
Coord from{};
Coord to{};
PieceKind promo{PieceKind::Queen}; // only read when a pawn reaches the last rank
};


// What apply_move did
struct MoveRecord {
Move move{};
PieceKind moved{PieceKind::Pawn};
std::optional<Piece> captured;
MoveFlag flags{MoveFlag::Quiet};
};


} // namespace chessync
