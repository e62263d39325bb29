#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include <cstdint>
#include <stdexcept>

#include "chessync/types.hpp"
#include "chessync/board.hpp"
#include "chessync/codec.hpp"
#include "chessync/fen.hpp"
#include "chessync/attack.hpp"
#include "chessync/validator.hpp"
#include "chessync/apply.hpp"
#include "chessync/movegen.hpp"
#include "chessync/perft.hpp"

using namespace chessync;

static void usage() {
  std::cout <<
    "chessync CLI\n"
    "Usage:\n"
    "  chessync_cli start\n"
    "  chessync_cli fen <state>\n"
    "  chessync_cli from-fen <fen...>\n"
    "  chessync_cli show <state>\n"
    "  chessync_cli legal <state> <from> <to>\n"
    "  chessync_cli apply <state> <from> <to> [q|r|b|n]\n"
    "  chessync_cli moves <state> <from>\n"
    "  chessync_cli check <state> light|dark\n"
    "  chessync_cli perft <depth> [light|dark] [state]\n"
    "<state> is an encoded board; 'start' means the standard setup.\n";
}

static std::string join_from(const std::vector<std::string>& a, size_t i) {
  if (i >= a.size()) return "";
  std::ostringstream oss;
  for (size_t k = i; k < a.size(); ++k) {
    if (k > i) oss << ' ';
    oss << a[k];
  }
  return oss.str();
}

static Board board_from_arg(const std::string& s) {
  if (s == "start") return Board::standard_setup();
  if (s == "empty" || s == "-") return Board::empty();
  return decode(s);
}

static Color color_from_arg(const std::string& s) {
  if (s == "light") return Color::Light;
  if (s == "dark") return Color::Dark;
  throw std::invalid_argument("color must be 'light' or 'dark'");
}

static PieceKind promo_from_arg(const std::string& s) {
  if (s.size() != 1) throw std::invalid_argument("bad promotion piece");
  const PieceKind k = kind_from_char(s[0]);
  if (k == PieceKind::Pawn || k == PieceKind::King) throw std::invalid_argument("bad promotion piece");
  return k;
}

static void print_board(const Board& b) {
  for (int r = 7; r >= 0; --r) {
    std::cout << (r + 1) << ' ';
    for (int f = 0; f < 8; ++f) {
      const Piece* p = b.piece_at(Coord{ f, r });
      char c = '.';
      if (p) {
        c = kind_to_char(p->kind);
        if (p->color == Color::Light) c = char(c - 'a' + 'A');
      }
      std::cout << c << (f < 7 ? " " : "\n");
    }
  }
  std::cout << "  a b c d e f g h\n";
}

static int run(const std::vector<std::string>& args) {
  const std::string cmd = args[0];

  if (cmd == "start") {
    std::cout << encode(Board::standard_setup()) << "\n";
    return 0;
  }

  if (cmd == "fen") {
    if (args.size() < 2) { usage(); return 1; }
    std::cout << to_fen(board_from_arg(args[1])) << "\n";
    return 0;
  }

  if (cmd == "from-fen") {
    if (args.size() < 2) { usage(); return 1; }
    Board b;
    set_from_fen(b, join_from(args, 1));
    std::cout << encode(b) << "\n";
    return 0;
  }

  if (cmd == "show") {
    if (args.size() < 2) { usage(); return 1; }
    print_board(board_from_arg(args[1]));
    return 0;
  }

  // legal <state> <from> <to>
  if (cmd == "legal") {
    if (args.size() < 4) { usage(); return 1; }
    const Board b = board_from_arg(args[1]);
    const Verdict v = check_move(b, coord_from_string(args[2]), coord_from_string(args[3]));
    std::cout << to_string(v) << "\n";
    return v == Verdict::Legal ? 0 : 2;
  }

  // apply <state> <from> <to> [promo]
  if (cmd == "apply") {
    if (args.size() < 4) { usage(); return 1; }
    Board b = board_from_arg(args[1]);
    const Coord from = coord_from_string(args[2]);
    const Coord to = coord_from_string(args[3]);
    const PieceKind promo = args.size() > 4 ? promo_from_arg(args[4]) : PieceKind::Queen;
    const Verdict v = check_move(b, from, to);
    if (v != Verdict::Legal) {
      std::cerr << "illegal: " << to_string(v) << "\n";
      return 2;
    }
    apply_move(b, from, to, promo);
    std::cout << encode(b) << "\n";
    return 0;
  }

  // moves <state> <from>
  if (cmd == "moves") {
    if (args.size() < 3) { usage(); return 1; }
    const Board b = board_from_arg(args[1]);
    const Piece* p = b.piece_at(coord_from_string(args[2]));
    if (!p) { std::cerr << "no piece on " << args[2] << "\n"; return 2; }
    for (const Coord& c : legal_destinations(b, *p)) std::cout << coord_to_string(c) << ' ';
    std::cout << "\n";
    return 0;
  }

  // check <state> light|dark
  if (cmd == "check") {
    if (args.size() < 3) { usage(); return 1; }
    const bool ck = is_in_check(board_from_arg(args[1]), color_from_arg(args[2]));
    std::cout << (ck ? "check" : "no check") << "\n";
    return 0;
  }

  // perft <depth> [light|dark] [state]
  if (cmd == "perft") {
    if (args.size() < 2) { usage(); return 1; }
    const int depth = std::stoi(args[1]);
    const Color side = args.size() > 2 ? color_from_arg(args[2]) : Color::Light;
    const Board b = args.size() > 3 ? board_from_arg(args[3]) : Board::standard_setup();
    std::cout << perft(b, side, depth) << "\n";
    return 0;
  }

  usage();
  return 1;
}

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);
  if (args.empty()) { usage(); return 0; }

  try {
    return run(args);
  } catch (const DecodeError& e) {
    std::cerr << "decode error: " << e.what() << "\n";
  } catch (const FenError& e) {
    std::cerr << "fen error: " << e.what() << "\n";
  } catch (const std::invalid_argument& e) {
    std::cerr << "bad argument: " << e.what() << "\n";
  } catch (const std::out_of_range& e) {
    std::cerr << "bad argument: " << e.what() << "\n";
  }
  return 1;
}
