#include <cassert>
#include <cstring>
#include <sstream>
#include <string>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include "chessync/apply.hpp"
#include "chessync/board.hpp"
#include "chessync/codec.hpp"
#include "chessync/server.hpp"
#include "chessync/session.hpp"

using namespace chessync;

static int connect_local(std::uint16_t port) {
  const int fd = socket(AF_INET, SOCK_STREAM, 0);
  assert(fd >= 0);
  sockaddr_in sa;
  std::memset(&sa, 0, sizeof(sa));
  sa.sin_family = AF_INET;
  sa.sin_port = htons(port);
  sa.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  const int rc = connect(fd, reinterpret_cast<const sockaddr*>(&sa), sizeof(sa));
  assert(rc == 0);
  return fd;
}

// Drive the server until the client socket yields one full line.
static bool read_line(TcpServer& srv, int fd, LineBuffer& buf, std::string& out) {
  for (int i = 0; i < 200; ++i) {
    if (buf.next_line(out)) return true;
    srv.poll_once(10);
    char tmp[1024];
    const ssize_t n = recv(fd, tmp, sizeof(tmp), MSG_DONTWAIT);
    if (n > 0) buf.append(tmp, static_cast<std::size_t>(n));
  }
  return buf.next_line(out);
}

static void send_line(int fd, const std::string& line) {
  const std::string wire = line + "\r\n";
  const ssize_t n = send(fd, wire.data(), wire.size(), MSG_NOSIGNAL);
  assert(n == static_cast<ssize_t>(wire.size()));
}

int main() {
  // LineBuffer
  {
    LineBuffer lb;
    std::string line;
    lb.append("move e2", 7);
    assert(!lb.next_line(line));
    const std::string rest = " e4\r\nreset\n\npartial";
    lb.append(rest.data(), rest.size());
    assert(lb.next_line(line) && line == "move e2 e4");
    assert(lb.next_line(line) && line == "reset");
    assert(lb.next_line(line) && line.empty());
    assert(!lb.next_line(line));
    assert(lb.pending() == 7);
  }

  // Two clients over loopback
  {
    Session session;
    TcpServer srv(session, 0);
    assert(srv.port() != 0);

    const int a = connect_local(srv.port());
    LineBuffer abuf;
    std::string line;
    assert(read_line(srv, a, abuf, line));
    const std::string start = "set " + encode(Board::standard_setup());
    assert(line == start);
    assert(srv.connection_count() == 1);

    const int b = connect_local(srv.port());
    LineBuffer bbuf;
    assert(read_line(srv, b, bbuf, line));
    assert(line == start);
    assert(srv.connection_count() == 2);
    assert(session.participant_count() == 2);

    send_line(a, "move e2 e4");
    Board after = Board::standard_setup();
    apply_move(after, coord_from_string("e2"), coord_from_string("e4"));
    const std::string moved = "set " + encode(after);
    assert(read_line(srv, a, abuf, line) && line == moved);
    assert(read_line(srv, b, bbuf, line) && line == moved);

    send_line(b, "move e4 e6");
    assert(read_line(srv, b, bbuf, line) && line == "reject e4 e6 bad-pattern");

    // hang-up removes the participant
    close(b);
    for (int i = 0; i < 200 && srv.connection_count() != 1; ++i) srv.poll_once(10);
    assert(srv.connection_count() == 1);
    assert(session.participant_count() == 1);
    close(a);
  }

  // A peer that never ends its line is cut off
  {
    std::ostringstream log;
    Session session;
    TcpServer srv(session, 0, &log);
    const int a = connect_local(srv.port());
    LineBuffer abuf;
    std::string line;
    assert(read_line(srv, a, abuf, line));
    assert(srv.connection_count() == 1);

    const std::string flood(MAX_LINE_LEN + 500, 'x');
    const ssize_t n = send(a, flood.data(), flood.size(), MSG_NOSIGNAL);
    assert(n == static_cast<ssize_t>(flood.size()));
    for (int i = 0; i < 200 && srv.connection_count() != 0; ++i) srv.poll_once(10);
    assert(srv.connection_count() == 0);
    assert(session.participant_count() == 0);
    assert(log.str().find("input line over") != std::string::npos);
    close(a);
  }

  // A peer whose unsent output passes the backlog limit is cut off
  {
    std::ostringstream log;
    Session session;
    // smaller than one "set" line, so the greeting alone overflows
    TcpServer srv(session, 0, &log, 100);
    const int a = connect_local(srv.port());
    for (int i = 0; i < 200 && log.str().find("closed") == std::string::npos; ++i) srv.poll_once(10);
    assert(srv.connection_count() == 0);
    assert(session.participant_count() == 0);
    assert(log.str().find("output backlog over 100 bytes") != std::string::npos);
    close(a);
  }

  // LineBuffer keeps an unterminated tail as pending
  {
    LineBuffer lb;
    std::string line;
    const std::string tail(2000, 'x');
    lb.append(tail.data(), tail.size());
    assert(!lb.next_line(line));
    assert(lb.pending() == 2000);
  }

  return 0;
}
