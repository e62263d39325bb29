#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

#include "chessync/session.hpp"

namespace chessync {

// A peer holding more than this without a newline is dropped.
constexpr std::size_t MAX_LINE_LEN = 1024;
// Unsent output a connection may queue before it is dropped.
constexpr std::size_t MAX_OUTPUT_BACKLOG = 64000;

// Splits a byte stream into lines. A '\r' before the '\n' is dropped.
class LineBuffer {
public:
  void append(const char* data, std::size_t n) { buf_.append(data, n); }
  bool next_line(std::string& out);
  std::size_t pending() const { return buf_.size(); }

private:
  std::string buf_;
};

// Line-oriented TCP front end for a Session. Single threaded: every socket is
// non-blocking and serviced from poll_once(); inbound lines are posted to the
// session and pumped before the call returns.
class TcpServer {
public:
  // port 0 binds an ephemeral port, see port(). Throws std::system_error.
  TcpServer(Session& session, std::uint16_t port, std::ostream* log = nullptr,
            std::size_t max_backlog = MAX_OUTPUT_BACKLOG);
  ~TcpServer();

  TcpServer(const TcpServer&) = delete;
  TcpServer& operator=(const TcpServer&) = delete;

  std::uint16_t port() const { return port_; }
  std::size_t connection_count() const { return conns_.size(); }

  void poll_once(int timeout_ms);
  void run(const std::atomic<bool>& stop, int poll_ms = 100);

private:
  struct Connection;

  void accept_();
  bool read_(Connection& c);
  bool flush_(Connection& c);
  void log_(const std::string& line) const;

  Session& session_;
  std::ostream* log_out_ = nullptr;
  int listen_fd_ = -1;
  std::uint16_t port_ = 0;
  std::size_t max_backlog_ = MAX_OUTPUT_BACKLOG;
  std::vector<std::unique_ptr<Connection>> conns_;
};

} // namespace chessync
