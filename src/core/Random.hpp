// ========================= src/core/Random.hpp =========================
#pragma once
#include <cstdint>
#include <vector>
#include <utility>

namespace lp {

    // mulberry32 with the state pre-advanced by one increment at seeding. Output must stay bit-exact
    // so that a (level, salt) pair always yields the same board.
    struct RNG {
        uint32_t t{ 0 };

        RNG() = default;
        explicit RNG(uint32_t seed) :t(seed + 0x6D2B79F5u) {}

        uint32_t nextU32();
        double next();                 // [0, 1)
        int range(int lo, int hi);     // inclusive

        template <typename T>
        void shuffle(std::vector<T>& v) {
            for (int i = static_cast<int>(v.size()) - 1; i > 0; --i) {
                int j = static_cast<int>(next() * (i + 1));
                std::swap(v[i], v[j]);
            }
        }
    };

    uint32_t levelSeed(int level, uint32_t salt = 0);
    uint32_t attemptSeed(uint32_t seed, int attempt);

} // namespace lp
