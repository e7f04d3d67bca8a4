#pragma once

#include <cstddef>
#include <random>
#include <string>
#include <vector>

namespace bench {

// Every random choice of one generation request draws from one engine, so a
// request with the same seed reproduces the same cases.
using Rng = std::mt19937;

inline bool chance(Rng& rng, double p) {
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(rng) < p;
}

// uniform in [lo, hi]
inline size_t pick_index(Rng& rng, size_t lo, size_t hi) {
    std::uniform_int_distribution<size_t> dist(lo, hi);
    return dist(rng);
}

template <typename T>
const T& pick(Rng& rng, const std::vector<T>& items) {
    return items[pick_index(rng, 0, items.size() - 1)];
}

// n upper-case hex digits
std::string random_hex(Rng& rng, size_t n);

}  // namespace bench
