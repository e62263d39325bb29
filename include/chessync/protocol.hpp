#pragma once
#include <stdexcept>
#include <string>
#include <string_view>
#include "chessync/types.hpp"

namespace chessync {

struct ProtocolError : std::runtime_error { using std::runtime_error::runtime_error; };

// One message per line:
//   move <from> <to> [q|r|b|n]     client -> server
//   reset                          client -> server
//   set [<encoded board>]          server -> client
//   reject <from> <to> <reason>    server -> requesting client
//   error <text...>                server -> requesting client
enum class MessageType { Move, Reset, Set, Reject, Error };

struct Message {
  MessageType type = MessageType::Reset;
  Coord from{};
  Coord to{};
  PieceKind promotion = PieceKind::Queen;
  std::string payload; // encoded board (set), reason (reject), text (error)
};

// Throws ProtocolError on unknown verbs, wrong arity or bad coordinates.
Message parse_message(std::string_view line);

std::string format_move(Coord from, Coord to, PieceKind promotion = PieceKind::Queen);
std::string format_reset();
std::string format_set(const std::string& encoded);
std::string format_reject(Coord from, Coord to, std::string_view reason);
std::string format_error(std::string_view text);

} // namespace chessync
