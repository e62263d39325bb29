#include "chessync/options.hpp"
#include "chessync/server.hpp"
#include "chessync/session.hpp"

#include <atomic>
#include <csignal>
#include <exception>
#include <iostream>
#include <string>
#include <system_error>
#include <vector>

static std::atomic<bool> G_STOP{false};

static void on_signal(int) { G_STOP.store(true, std::memory_order_relaxed); }

int main(int argc, char** argv) {
  using namespace chessync;

  ServerOptions opt;
  try {
    opt = parse_server_args(std::vector<std::string>(argv + 1, argv + argc));
  } catch (const std::invalid_argument& e) {
    std::cerr << e.what() << "\n" << server_usage();
    return 1;
  }
  if (opt.help) { std::cout << server_usage(); return 0; }

  std::ostream* log = opt.quiet ? nullptr : &std::cerr;

  if (opt.stdio) {
    std::ios::sync_with_stdio(false);
    std::cin.tie(nullptr);
    session_loop(std::cin, std::cout, opt.session, log);
    return 0;
  }

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  try {
    Session session(opt.session, log);
    TcpServer server(session, opt.port, log);
    server.run(G_STOP);
  } catch (const std::system_error& e) {
    std::cerr << "chessync_server: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
