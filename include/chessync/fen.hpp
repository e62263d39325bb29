#pragma once
#include <string>
#include <string_view>
#include <stdexcept>
#include "chessync/board.hpp"

namespace chessync {

struct FenError : std::runtime_error { using std::runtime_error::runtime_error; };

inline constexpr char STARTPOS_FEN[] =
  "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1";

// Only the placement field is required; active color, castling and
// en-passant default to "w - -". Clocks are accepted and ignored.
// has_not_moved / is_en_passant_target are derived from the castling and
// en-passant fields. Returns the side to move.
Color set_from_fen(Board& b, std::string_view fen);
std::string to_fen(const Board& b, Color side_to_move = Color::Light);

} // namespace chessync
