#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "chessync/session.hpp"

namespace chessync {

struct ServerOptions {
  std::uint16_t port = 7777;
  bool stdio = false;   // serve one participant over stdin/stdout
  bool quiet = false;   // no diagnostics on stderr
  bool help = false;
  SessionConfig session{};
};

// Flags: --port N, --stdio, --quiet, --enforce-turns, --silent-rejections, --help.
// Throws std::invalid_argument on unknown flags or bad values.
ServerOptions parse_server_args(const std::vector<std::string>& args);

std::string server_usage();

} // namespace chessync
