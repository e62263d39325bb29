#include "chessync/client.hpp"
#include "chessync/apply.hpp"
#include "chessync/codec.hpp"
#include "chessync/protocol.hpp"

#include <utility>

namespace chessync {

ClientSession::ClientSession(Sender send) : send_(std::move(send)) {}

bool ClientSession::request_move(Coord from, Coord to, PieceKind promo) {
  if (state_ != ClientState::Idle) return false;

  last_verdict_ = check_move(board_, from, to);
  if (last_verdict_ != Verdict::Legal) return false;

  apply_move(board_, Move{ from, to, promo });
  state_ = ClientState::AwaitingAuthoritative;
  send_(format_move(from, to, promo));
  return true;
}

void ClientSession::request_reset() {
  state_ = ClientState::AwaitingAuthoritative;
  send_(format_reset());
}

void ClientSession::cancel() {
  board_ = confirmed_;
  state_ = ClientState::Idle;
}

void ClientSession::on_message(const std::string& line) {
  const Message msg = parse_message(line);
  switch (msg.type) {
    case MessageType::Set: {
      Board next = decode(msg.payload);
      confirmed_ = next;
      board_ = std::move(next);
      state_ = ClientState::Idle;
      break;
    }
    case MessageType::Reject:
      last_rejection_ = msg.payload;
      board_ = confirmed_;
      state_ = ClientState::Idle;
      break;
    case MessageType::Error:
      last_rejection_ = msg.payload;
      board_ = confirmed_;
      state_ = ClientState::Idle;
      break;
    case MessageType::Move:
    case MessageType::Reset:
      throw ProtocolError("servers only send 'set', 'reject' or 'error'");
  }
}

} // namespace chessync
