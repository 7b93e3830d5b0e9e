// ========================= src/core/Random.cpp =========================
#include "Random.hpp"

namespace lp {

    uint32_t RNG::nextU32() {
        t += 0x6D2B79F5u;
        uint32_t x = t;
        x = (x ^ (x >> 15)) * (1u | x);
        x ^= x + (x ^ (x >> 7)) * (61u | x);
        return x ^ (x >> 14);
    }

    double RNG::next() { return nextU32() / 4294967296.0; }

    int RNG::range(int lo, int hi) {
        if (hi < lo) return lo;
        return lo + static_cast<int>(next() * (static_cast<double>(hi) - lo + 1));
    }

    uint32_t levelSeed(int level, uint32_t salt) {
        return static_cast<uint32_t>(level + 1) * 10007u + salt * 97u;
    }

    uint32_t attemptSeed(uint32_t seed, int attempt) { return seed + static_cast<uint32_t>(attempt) * 131u; }

} // namespace lp
