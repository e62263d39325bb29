#include "chessync/zobrist.hpp"


namespace chessync {


const Zobrist& Zobrist::instance() {
static const Zobrist z = [] { Zobrist k; k.init(); return k; }();
return z;
}


void Zobrist::init(std::uint64_t seed) {
std::uint64_t x = seed;
auto next = [&]() -> std::uint64_t { return splitmix64(x); };


for (int c = 0; c < COLOR_N; ++c)
for (int p = 0; p < KIND_N; ++p)
for (int s = 0; s < SQUARE_N; ++s)
piece_on[static_cast<std::size_t>(c)]
[static_cast<std::size_t>(p)]
[static_cast<std::size_t>(s)] = next();


for (auto& k : unmoved) k = next();
for (auto& k : ep_target) k = next();
}


} // namespace chessync
