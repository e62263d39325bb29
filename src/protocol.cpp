#include "chessync/protocol.hpp"
#include "chessync/codec.hpp"

#include <sstream>
#include <vector>

namespace chessync {

// ------------ helpers ------------
static std::vector<std::string> split_ws(std::string_view line) {
  std::istringstream iss{std::string(line)};
  std::vector<std::string> out;
  std::string tok;
  while (iss >> tok) out.push_back(tok);
  return out;
}

static Coord parse_coord(const std::string& s) {
  try {
    return coord_from_string(s);
  } catch (const std::invalid_argument&) {
    throw ProtocolError("bad coordinate '" + s + "'");
  }
}

static PieceKind parse_promotion(const std::string& s) {
  if (s == "q") return PieceKind::Queen;
  if (s == "r") return PieceKind::Rook;
  if (s == "b") return PieceKind::Bishop;
  if (s == "n") return PieceKind::Knight;
  throw ProtocolError("bad promotion piece '" + s + "'");
}

static void expect_arity(const std::vector<std::string>& toks, std::size_t lo, std::size_t hi) {
  if (toks.size() < lo || toks.size() > hi)
    throw ProtocolError("wrong number of arguments for '" + toks[0] + "'");
}

// ------------ parsing ------------
Message parse_message(std::string_view line) {
  const auto toks = split_ws(line);
  if (toks.empty()) throw ProtocolError("empty message");

  Message m;
  const std::string& cmd = toks[0];

  if (cmd == "move") {
    expect_arity(toks, 3, 4);
    m.type = MessageType::Move;
    m.from = parse_coord(toks[1]);
    m.to   = parse_coord(toks[2]);
    if (toks.size() == 4) m.promotion = parse_promotion(toks[3]);
  }
  else if (cmd == "reset") {
    expect_arity(toks, 1, 1);
    m.type = MessageType::Reset;
  }
  else if (cmd == "set") {
    expect_arity(toks, 1, 2);
    m.type = MessageType::Set;
    if (toks.size() == 2) m.payload = toks[1];
  }
  else if (cmd == "reject") {
    expect_arity(toks, 4, 4);
    m.type = MessageType::Reject;
    m.from = parse_coord(toks[1]);
    m.to   = parse_coord(toks[2]);
    m.payload = toks[3];
  }
  else if (cmd == "error") {
    m.type = MessageType::Error;
    for (std::size_t i = 1; i < toks.size(); ++i) {
      if (!m.payload.empty()) m.payload.push_back(' ');
      m.payload += toks[i];
    }
  }
  else {
    throw ProtocolError("unknown message '" + cmd + "'");
  }
  return m;
}

// ------------ formatting ------------
std::string format_move(Coord from, Coord to, PieceKind promotion) {
  std::string s = "move " + coord_to_string(from) + " " + coord_to_string(to);
  if (promotion != PieceKind::Queen) {
    s.push_back(' ');
    s.push_back(kind_to_char(promotion));
  }
  return s;
}

std::string format_reset() { return "reset"; }

std::string format_set(const std::string& encoded) {
  return encoded.empty() ? std::string("set") : "set " + encoded;
}

std::string format_reject(Coord from, Coord to, std::string_view reason) {
  return "reject " + coord_to_string(from) + " " + coord_to_string(to) + " " + std::string(reason);
}

std::string format_error(std::string_view text) {
  return "error " + std::string(text);
}

} // namespace chessync
