#pragma once
#include <array>
#include <cstdint>
#include "chessync/types.hpp"


namespace chessync {


struct Zobrist {
// piece_on[color][kind][square]
std::array<std::array<std::array<U64, SQUARE_N>, KIND_N>, COLOR_N> piece_on{};
// per-square flag keys, xored in when the occupant carries the flag
std::array<U64, SQUARE_N> unmoved{};
std::array<U64, SQUARE_N> ep_target{};


// keys are filled on first use
static const Zobrist& instance();
void init(std::uint64_t seed = 0x9E3779B97F4A7C15ULL);
};


// Mix helper for deterministic RNG seeding
inline std::uint64_t splitmix64(std::uint64_t& x) {
x += 0x9e3779b97f4a7c15ULL;
std::uint64_t z = x;
z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
return z ^ (z >> 31);
}


} // namespace chessync
