#include <cassert>
#include <string>
#include <vector>
#include "chessync/board.hpp"
#include "chessync/client.hpp"
#include "chessync/codec.hpp"
#include "chessync/protocol.hpp"
#include "chessync/session.hpp"

using namespace chessync;

static Coord at(const char* s) { return coord_from_string(s); }

// Server-side stand-in for a client connection: delivers straight into it.
struct Link : Participant {
  ClientSession* client = nullptr;
  void deliver(const std::string& line) override { client->on_message(line); }
};

int main() {
  // Provisional move, then the server confirms it
  {
    Session server;
    ParticipantId id = 0;
    std::vector<std::string> sent;
    ClientSession c([&](const std::string& line) {
      sent.push_back(line);
      server.post(id, line);
    });
    Link link;
    link.client = &c;
    id = server.join(link);

    assert(c.state() == ClientState::Idle);
    assert(c.board() == Board::standard_setup());
    assert(c.confirmed() == c.board());

    assert(c.request_move(at("e2"), at("e4")));
    assert(sent.size() == 1 && sent[0] == "move e2 e4");
    assert(c.state() == ClientState::AwaitingAuthoritative);
    assert(c.board().occupied(at("e4")));
    assert(c.confirmed() == Board::standard_setup());

    // one request in flight at a time
    assert(!c.request_move(at("e7"), at("e5")));
    assert(sent.size() == 1);

    assert(server.pump() == 1);
    assert(c.state() == ClientState::Idle);
    assert(c.board() == server.board());
    assert(c.confirmed() == server.board());

    // refused locally: nothing goes out
    assert(!c.request_move(at("e4"), at("e6")));
    assert(c.last_verdict() == Verdict::BadPattern);
    assert(!c.request_move(at("e3"), at("e4")));
    assert(c.last_verdict() == Verdict::NoPiece);
    assert(sent.size() == 1);
    assert(c.state() == ClientState::Idle);

    // reset round trip
    c.request_reset();
    assert(c.state() == ClientState::AwaitingAuthoritative);
    assert(sent.back() == "reset");
    server.pump();
    assert(c.state() == ClientState::Idle);
    assert(c.board() == Board::standard_setup());
  }

  // Server refuses: the provisional move is rolled back
  {
    SessionConfig cfg;
    cfg.enforce_turns = true;
    Session server(cfg);
    ParticipantId id = 0;
    ClientSession c([&](const std::string& line) { server.post(id, line); });
    Link link;
    link.client = &c;
    id = server.join(link);

    assert(c.request_move(at("e7"), at("e5")));
    assert(c.board().occupied(at("e5")));
    server.pump();
    assert(c.state() == ClientState::Idle);
    assert(c.last_rejection() == "turn");
    assert(c.board() == Board::standard_setup());
    assert(c.board() == c.confirmed());
  }

  // Inbound lines the client cannot use
  {
    ClientSession c([](const std::string&) {});
    c.on_message("set " + encode(Board::standard_setup()));
    const Board before = c.board();

    bool threw = false;
    try { c.on_message("set q0zz10"); } catch (const DecodeError&) { threw = true; }
    assert(threw);
    assert(c.board() == before);
    assert(c.state() == ClientState::Idle);

    threw = false;
    try { c.on_message("move e2 e4"); } catch (const ProtocolError&) { threw = true; }
    assert(threw);

    threw = false;
    try { c.on_message("hello"); } catch (const ProtocolError&) { threw = true; }
    assert(threw);

    // an error line also rolls back
    assert(c.request_move(at("g1"), at("f3")));
    c.on_message("error bad coordinate 'z9'");
    assert(c.last_rejection() == "bad coordinate 'z9'");
    assert(c.board() == before);
    assert(c.state() == ClientState::Idle);

    // "set" with no payload is an empty board
    c.on_message("set");
    assert(c.board().piece_count() == 0);
  }

  // Turns enforced, rejections silenced: the turn refusal still comes back
  {
    SessionConfig cfg;
    cfg.enforce_turns = true;
    cfg.notify_rejections = false;
    Session server(cfg);
    ParticipantId id = 0;
    int sent = 0;
    ClientSession c([&](const std::string& line) { ++sent; server.post(id, line); });
    Link link;
    link.client = &c;
    id = server.join(link);

    assert(c.request_move(at("e7"), at("e5")));
    assert(sent == 1);
    server.pump();
    assert(c.state() == ClientState::Idle);
    assert(c.last_rejection() == "turn");
    assert(!c.board().occupied(at("e5")));
    assert(c.board() == server.board());

    // and the next request goes through
    assert(c.request_move(at("e2"), at("e4")));
    server.pump();
    assert(c.state() == ClientState::Idle);
    assert(c.board() == server.board());
    assert(server.side_to_move() == Color::Dark);
  }

  // Giving up on a pending request
  {
    ClientSession c([](const std::string&) {});
    c.on_message("set " + encode(Board::standard_setup()));
    assert(c.request_move(at("b1"), at("c3")));
    assert(c.state() == ClientState::AwaitingAuthoritative);
    c.cancel();
    assert(c.state() == ClientState::Idle);
    assert(c.board() == Board::standard_setup());
    assert(c.request_move(at("b1"), at("c3")));
  }

  return 0;
}
