#pragma once
#include <stdexcept>
#include <string>
#include <string_view>
#include "chessync/board.hpp"

namespace chessync {

struct DecodeError : std::runtime_error { using std::runtime_error::runtime_error; };

// Record layout, 6 chars per occupied square, no separators:
//   [0] kind  p n b r q k
//   [1] color 0 = Light, 1 = Dark
//   [2] file  a..h
//   [3] rank  1..8
//   [4] en-passant target 0/1
//   [5] has-not-moved 0/1
// Squares are emitted file-major (a1, a2, .., a8, b1, ..); decode accepts any order.
constexpr std::size_t RECORD_LEN = 6;

std::string encode(const Board& b);

// Throws DecodeError on bad length, unknown characters or a square named twice.
Board decode(std::string_view text);

// Non-throwing variant; `out` is untouched on failure.
bool try_decode(std::string_view text, Board& out, std::string* err = nullptr);

char kind_to_char(PieceKind k);
// Accepts either case; throws DecodeError on anything else.
PieceKind kind_from_char(char c);

// "e4" style coordinates
std::string coord_to_string(Coord c);
Coord coord_from_string(std::string_view s); // throws std::invalid_argument

} // namespace chessync
