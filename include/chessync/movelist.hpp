#pragma once
#include <cstddef>
#include <vector>
#include "chessync/move.hpp"


namespace chessync {


// Move buffer. Sized for real games up front, but grows for decoded boards
// that hold more pieces than a game can.
class MoveList {
public:
static constexpr std::size_t RESERVE = 256;

MoveList() { moves_.reserve(RESERVE); }

void push(const Move& m) { moves_.push_back(m); }
void clear() { moves_.clear(); }

const Move* begin() const { return moves_.data(); }
const Move* end() const { return moves_.data() + moves_.size(); }
const Move& operator[](std::size_t i) const { return moves_[i]; }
std::size_t size() const { return moves_.size(); }
bool empty() const { return moves_.empty(); }

bool contains(Coord from, Coord to) const {
  for (const Move& m : *this) if (m.from == from && m.to == to) return true;
  return false;
}

private:
std::vector<Move> moves_;
};


} // namespace chessync
