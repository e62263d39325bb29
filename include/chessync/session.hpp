#pragma once
#include <cstddef>
#include <deque>
#include <iosfwd>
#include <map>
#include <mutex>
#include <string>
#include <utility>

#include "chessync/board.hpp"
#include "chessync/move.hpp"

namespace chessync {

struct SessionConfig {
  bool enforce_turns = false;     // refuse moves by the side not on move
  bool notify_rejections = true;  // answer illegal moves with "reject ..."; "turn" is always answered
};

using ParticipantId = int;

// Anything that can receive protocol lines: a socket, a stream, a test double.
class Participant {
public:
  virtual ~Participant() = default;
  virtual void deliver(const std::string& line) = 0;
};

// Server-side owner of the canonical board. Inbound lines are queued by post()
// from any thread and handled one at a time, in arrival order, by pump().
class Session {
public:
  explicit Session(SessionConfig cfg = {}, std::ostream* log = nullptr);

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  // The participant must outlive its membership; it is sent the current state.
  ParticipantId join(Participant& p);
  void leave(ParticipantId id);
  std::size_t participant_count() const { return peers_.size(); }

  void post(ParticipantId from, std::string line);
  std::size_t pump();

  // Handle one line right away. Malformed lines are logged and, when
  // rejections are enabled, answered with "error ...".
  void handle(ParticipantId from, const std::string& line);

  void reset();
  // True when the move was applied and broadcast.
  bool request_move(ParticipantId from, const Move& m);

  const Board& board() const { return board_; }
  std::string state() const;
  Color side_to_move() const { return stm_; }
  const SessionConfig& config() const { return cfg_; }

private:
  void broadcast_(const std::string& line);
  void send_(ParticipantId to, const std::string& line);
  void log_(const std::string& line) const;

  SessionConfig cfg_;
  std::ostream* log_out_ = nullptr;

  Board board_ = Board::standard_setup();
  Color stm_ = Color::Light;

  std::map<ParticipantId, Participant*> peers_;
  ParticipantId next_id_ = 1;

  std::mutex queue_mu_;
  std::deque<std::pair<ParticipantId, std::string>> queue_;
};

// Single participant wired to `out`, lines read from `in` until EOF or "quit".
void session_loop(std::istream& in, std::ostream& out,
                  SessionConfig cfg = {}, std::ostream* log = nullptr);

} // namespace chessync
