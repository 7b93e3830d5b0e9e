// ========================= src/core/Deadlock.hpp =========================
#pragma once
#include "Board.hpp"
#include "Random.hpp"

namespace lp {

    // True iff no remaining, visible piece can leave the board. Vacuously true on an empty board,
    // so callers check for a cleared board first.
    bool isDeadlock(const Board& board);
    int removableCount(const Board& board);
    std::vector<int> removablePieces(const Board& board);   // board indices

    // Removes a random removable piece until the board clears or jams. Returns true when cleared.
    bool greedyPlayout(Board board, RNG& rng, std::vector<int>* removalOrder = nullptr);

    // Fraction of `runs` random playouts that jam. A quick estimate only; DependencyGraph is exact.
    double estimateDeadlockProbability(const Board& board, RNG& rng, int runs = 20);

} // namespace lp
