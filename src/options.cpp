#include "chessync/options.hpp"

#include <stdexcept>

namespace chessync {

static std::uint16_t to_port(const std::string& s) {
  std::size_t used = 0;
  long v = 0;
  try {
    v = std::stol(s, &used);
  } catch (const std::exception&) {
    throw std::invalid_argument("bad port '" + s + "'");
  }
  if (used != s.size() || v < 0 || v > 65535) throw std::invalid_argument("bad port '" + s + "'");
  return static_cast<std::uint16_t>(v);
}

ServerOptions parse_server_args(const std::vector<std::string>& args) {
  ServerOptions opt;
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string& a = args[i];
    if (a == "--port") {
      if (i + 1 >= args.size()) throw std::invalid_argument("--port needs a value");
      opt.port = to_port(args[++i]);
    }
    else if (a == "--stdio")             opt.stdio = true;
    else if (a == "--quiet")             opt.quiet = true;
    else if (a == "--enforce-turns")     opt.session.enforce_turns = true;
    else if (a == "--silent-rejections") opt.session.notify_rejections = false;
    else if (a == "--help" || a == "-h") opt.help = true;
    else throw std::invalid_argument("unknown option '" + a + "'");
  }
  return opt;
}

std::string server_usage() {
  return
    "chessync_server\n"
    "Usage:\n"
    "  chessync_server [--port <N>] [--stdio] [--quiet]\n"
    "                  [--enforce-turns] [--silent-rejections]\n"
    "Default port 7777. --stdio serves a single participant on stdin/stdout.\n";
}

} // namespace chessync
