#include "chessync/server.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <system_error>
#include <unistd.h>

#include <iostream>

namespace chessync {

bool LineBuffer::next_line(std::string& out) {
  const auto nl = buf_.find('\n');
  if (nl == std::string::npos) return false;
  out.assign(buf_, 0, nl);
  if (!out.empty() && out.back() == '\r') out.pop_back();
  buf_.erase(0, nl + 1);
  return true;
}

struct TcpServer::Connection : Participant {
  int fd = -1;
  ParticipantId id = 0;
  std::string peer;
  LineBuffer in;
  std::string out;
  std::size_t max_out = MAX_OUTPUT_BACKLOG;
  bool dead = false;
  std::string why; // reason for dropping, logged on close

  void deliver(const std::string& line) override {
    if (dead) return;
    out += line;
    out += '\n';
    if (out.size() > max_out) {
      dead = true;
      why = "output backlog over " + std::to_string(max_out) + " bytes";
      out.clear();
    }
  }
};

static void set_nonblocking(int fd) {
  const int flags = fcntl(fd, F_GETFL, 0);
  if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0)
    throw std::system_error(errno, std::generic_category(), "fcntl O_NONBLOCK");
}

static std::system_error socket_error(const char* what, int fd) {
  const int err = errno;
  if (fd >= 0) close(fd);
  return std::system_error(err, std::generic_category(), what);
}

TcpServer::TcpServer(Session& session, std::uint16_t port, std::ostream* log,
                     std::size_t max_backlog)
  : session_(session), log_out_(log), max_backlog_(max_backlog) {
  int fd = socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) throw socket_error("socket", -1);

  int x = 1;
  if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &x, sizeof(x)) < 0)
    throw socket_error("setsockopt SO_REUSEADDR", fd);

  sockaddr_in sa;
  std::memset(&sa, 0, sizeof(sa));
  sa.sin_family = AF_INET;
  sa.sin_addr.s_addr = htonl(INADDR_ANY);
  sa.sin_port = htons(port);

  if (bind(fd, reinterpret_cast<const sockaddr*>(&sa), sizeof(sa)) < 0)
    throw socket_error("bind", fd);
  if (listen(fd, 50) < 0)
    throw socket_error("listen", fd);

  socklen_t len = sizeof(sa);
  if (getsockname(fd, reinterpret_cast<sockaddr*>(&sa), &len) < 0)
    throw socket_error("getsockname", fd);

  try {
    set_nonblocking(fd);
  } catch (const std::system_error&) {
    close(fd);
    throw;
  }

  listen_fd_ = fd;
  port_ = ntohs(sa.sin_port);
  log_("listening on port " + std::to_string(port_));
}

TcpServer::~TcpServer() {
  for (auto& c : conns_) {
    session_.leave(c->id);
    close(c->fd);
  }
  if (listen_fd_ >= 0) close(listen_fd_);
}

void TcpServer::log_(const std::string& line) const {
  if (log_out_) *log_out_ << "[server] " << line << "\n";
}

void TcpServer::accept_() {
  for (;;) {
    sockaddr_in sa;
    socklen_t len = sizeof(sa);
    const int fd = accept(listen_fd_, reinterpret_cast<sockaddr*>(&sa), &len);
    if (fd < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) return;
      log_(std::string("accept: ") + std::strerror(errno));
      return;
    }
    try {
      set_nonblocking(fd);
    } catch (const std::system_error& e) {
      log_(e.what());
      close(fd);
      continue;
    }

    auto c = std::make_unique<Connection>();
    c->fd = fd;
    c->max_out = max_backlog_;
    char host[INET_ADDRSTRLEN] = {0};
    inet_ntop(AF_INET, &sa.sin_addr, host, sizeof(host));
    c->peer = std::string(host) + ":" + std::to_string(ntohs(sa.sin_port));
    c->id = session_.join(*c); // queues the initial "set"
    log_("connection " + std::to_string(c->id) + " from " + c->peer);
    conns_.push_back(std::move(c));
  }
}

bool TcpServer::read_(Connection& c) {
  char buf[4096];
  for (;;) {
    const ssize_t n = recv(c.fd, buf, sizeof(buf), 0);
    if (n > 0) {
      c.in.append(buf, static_cast<std::size_t>(n));
      std::string line;
      while (c.in.next_line(line)) {
        if (!line.empty()) session_.post(c.id, line);
      }
      if (c.in.pending() > MAX_LINE_LEN) {
        c.why = "input line over " + std::to_string(MAX_LINE_LEN) + " bytes";
        return false;
      }
      continue;
    }
    if (n == 0) return false; // orderly hang-up
    if (errno == EINTR) continue;
    if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
    c.why = std::string("read: ") + std::strerror(errno);
    return false;
  }
}

bool TcpServer::flush_(Connection& c) {
  while (!c.out.empty()) {
    const ssize_t n = send(c.fd, c.out.data(), c.out.size(), MSG_NOSIGNAL);
    if (n > 0) {
      c.out.erase(0, static_cast<std::size_t>(n));
      continue;
    }
    if (n < 0 && errno == EINTR) continue;
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return true;
    c.why = std::string("write: ") + std::strerror(errno);
    return false;
  }
  return true;
}

void TcpServer::poll_once(int timeout_ms) {
  std::vector<pollfd> fds;
  fds.reserve(conns_.size() + 1);
  fds.push_back(pollfd{ listen_fd_, POLLIN, 0 });
  for (const auto& c : conns_) {
    short ev = POLLIN;
    if (!c->out.empty()) ev |= POLLOUT;
    fds.push_back(pollfd{ c->fd, ev, 0 });
  }

  const int rc = poll(fds.data(), static_cast<nfds_t>(fds.size()), timeout_ms);
  if (rc < 0) {
    if (errno == EINTR) return;
    throw std::system_error(errno, std::generic_category(), "poll");
  }

  // connections accepted below are not in `fds` yet
  const std::size_t polled = conns_.size();
  if (fds[0].revents & POLLIN) accept_();

  for (std::size_t i = 0; i < polled; ++i) {
    Connection& c = *conns_[i];
    const short re = fds[i + 1].revents;
    if (re & (POLLERR | POLLNVAL)) { c.dead = true; continue; }
    if (re & (POLLIN | POLLHUP)) {
      if (!read_(c)) c.dead = true;
    }
  }

  session_.pump();

  for (auto& c : conns_) {
    if (!c->dead && !flush_(*c)) c->dead = true;
  }

  for (auto it = conns_.begin(); it != conns_.end();) {
    if (!(*it)->dead) { ++it; continue; }
    session_.leave((*it)->id);
    close((*it)->fd);
    std::string msg = "connection " + std::to_string((*it)->id) + " from " + (*it)->peer + " closed";
    if (!(*it)->why.empty()) msg += ": " + (*it)->why;
    log_(msg);
    it = conns_.erase(it);
  }
}

void TcpServer::run(const std::atomic<bool>& stop, int poll_ms) {
  while (!stop.load(std::memory_order_relaxed)) poll_once(poll_ms);
}

} // namespace chessync
