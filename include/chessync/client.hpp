#pragma once
#include <functional>
#include <string>

#include "chessync/board.hpp"
#include "chessync/move.hpp"
#include "chessync/validator.hpp"

namespace chessync {

enum class ClientState { Idle, AwaitingAuthoritative };

// Client half of the sync protocol. Moves are validated and shown locally at
// once, but stay provisional until the server's next "set" arrives.
class ClientSession {
public:
  using Sender = std::function<void(const std::string&)>;

  explicit ClientSession(Sender send);

  // Only from Idle. Returns true when the move was applied locally and sent;
  // last_verdict() tells why it was not.
  bool request_move(Coord from, Coord to, PieceKind promo = PieceKind::Queen);
  void request_reset();
  // Drop a pending request: back to the confirmed board and Idle. For a UI
  // that gives up waiting on a server that may not answer.
  void cancel();

  // set: replace both boards and go Idle. reject / error: roll back to the
  // confirmed board and go Idle. A bad "set" payload throws DecodeError and
  // leaves everything unchanged; other malformed lines throw ProtocolError.
  void on_message(const std::string& line);

  const Board& board() const { return board_; }
  const Board& confirmed() const { return confirmed_; }
  ClientState state() const { return state_; }
  Verdict last_verdict() const { return last_verdict_; }
  const std::string& last_rejection() const { return last_rejection_; }

private:
  Sender send_;
  Board board_;      // what the UI shows, may hold a provisional move
  Board confirmed_;  // last state received from the server
  ClientState state_ = ClientState::Idle;
  Verdict last_verdict_ = Verdict::Legal;
  std::string last_rejection_;
};

} // namespace chessync
