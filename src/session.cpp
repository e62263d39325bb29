#include "chessync/session.hpp"
#include "chessync/apply.hpp"
#include "chessync/codec.hpp"
#include "chessync/protocol.hpp"
#include "chessync/validator.hpp"

#include <iostream>
#include <sstream>

namespace chessync {

static inline const char* color_name(Color c) { return c == Color::Light ? "light" : "dark"; }

Session::Session(SessionConfig cfg, std::ostream* log)
  : cfg_(cfg), log_out_(log) {}

void Session::log_(const std::string& line) const {
  if (log_out_) *log_out_ << "[session] " << line << "\n";
}

ParticipantId Session::join(Participant& p) {
  const ParticipantId id = next_id_++;
  peers_[id] = &p;
  log_("participant " + std::to_string(id) + " joined");
  p.deliver(format_set(state()));
  return id;
}

void Session::leave(ParticipantId id) {
  if (peers_.erase(id)) log_("participant " + std::to_string(id) + " left");
}

void Session::post(ParticipantId from, std::string line) {
  std::lock_guard<std::mutex> lk(queue_mu_);
  queue_.emplace_back(from, std::move(line));
}

std::size_t Session::pump() {
  std::size_t handled = 0;
  for (;;) {
    std::pair<ParticipantId, std::string> item;
    {
      std::lock_guard<std::mutex> lk(queue_mu_);
      if (queue_.empty()) break;
      item = std::move(queue_.front());
      queue_.pop_front();
    }
    handle(item.first, item.second);
    ++handled;
  }
  return handled;
}

void Session::handle(ParticipantId from, const std::string& line) {
  try {
    const Message msg = parse_message(line);
    switch (msg.type) {
      case MessageType::Move:
        request_move(from, Move{ msg.from, msg.to, msg.promotion });
        break;
      case MessageType::Reset:
        reset();
        break;
      case MessageType::Set:
      case MessageType::Reject:
      case MessageType::Error:
        throw ProtocolError("clients may only send 'move' or 'reset'");
    }
  } catch (const ProtocolError& e) {
    log_("participant " + std::to_string(from) + ": " + e.what());
    if (cfg_.notify_rejections) send_(from, format_error(e.what()));
  }
}

void Session::reset() {
  board_ = Board::standard_setup();
  stm_ = Color::Light;
  log_("reset");
  broadcast_(format_set(state()));
}

bool Session::request_move(ParticipantId from, const Move& m) {
  const Piece* p = board_.piece_at(m.from);
  if (!p) return false; // nothing to move: dropped without reply

  std::string reason;
  if (cfg_.enforce_turns && p->color != stm_) {
    reason = "turn";
  } else {
    const Verdict v = check_move(board_, *p, m.to);
    if (v != Verdict::Legal) reason = std::string(to_string(v));
  }

  if (!reason.empty()) {
    log_("participant " + std::to_string(from) + " move " + coord_to_string(m.from) + "-" +
         coord_to_string(m.to) + " rejected: " + reason);
    // clients cannot see whose turn it is, so "turn" is always answered
    if (cfg_.notify_rejections || reason == "turn")
      send_(from, format_reject(m.from, m.to, reason));
    return false;
  }

  const Color mover = p->color;
  const MoveRecord rec = apply_move(board_, m);
  stm_ = other(mover);

  std::ostringstream oss;
  oss << "participant " << from << " " << color_name(mover) << " "
      << kind_to_char(rec.moved) << " " << coord_to_string(m.from) << "-" << coord_to_string(m.to);
  if (rec.captured) oss << " x" << kind_to_char(rec.captured->kind);
  if (has_flag(rec.flags, MoveFlag::EnPassant)) oss << " ep";
  if (has_flag(rec.flags, MoveFlag::Castle)) oss << " castle";
  if (has_flag(rec.flags, MoveFlag::Promotion)) oss << " =" << kind_to_char(m.promo);
  oss << " key " << std::hex << board_.hash();
  log_(oss.str());

  broadcast_(format_set(state()));
  return true;
}

std::string Session::state() const { return encode(board_); }

void Session::broadcast_(const std::string& line) {
  for (auto& [id, peer] : peers_) peer->deliver(line);
}

void Session::send_(ParticipantId to, const std::string& line) {
  auto it = peers_.find(to);
  if (it != peers_.end()) it->second->deliver(line);
}

// ------------ stdio driver ------------
namespace {

class StreamParticipant : public Participant {
public:
  explicit StreamParticipant(std::ostream& out) : out_(out) {}
  void deliver(const std::string& line) override {
    out_ << line << "\n";
    out_.flush();
  }
private:
  std::ostream& out_;
};

} // namespace

void session_loop(std::istream& in, std::ostream& out, SessionConfig cfg, std::ostream* log) {
  Session session(cfg, log);
  StreamParticipant self(out);
  const ParticipantId id = session.join(self);

  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.empty()) continue;
    if (line == "quit") break;
    session.post(id, line);
    session.pump();
  }
  session.leave(id);
}

} // namespace chessync
