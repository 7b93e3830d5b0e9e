// ========================= src/core/Deadlock.cpp =========================
#include "Deadlock.hpp"
#include "Detector.hpp"

namespace lp {

    bool isDeadlock(const Board& board) {
        for (int i = 0; i < board.size(); ++i) {
            if (!board.isActive(i)) continue;
            if (!isBlocked(board, i)) return false;
        }
        return true;
    }

    int removableCount(const Board& board) {
        int n = 0;
        for (int i = 0; i < board.size(); ++i) if (board.isActive(i) && !isBlocked(board, i)) ++n;
        return n;
    }

    std::vector<int> removablePieces(const Board& board) {
        std::vector<int> out;
        for (int i = 0; i < board.size(); ++i) if (board.isActive(i) && !isBlocked(board, i)) out.push_back(i);
        return out;
    }

    bool greedyPlayout(Board board, RNG& rng, std::vector<int>* removalOrder) {
        if (removalOrder) removalOrder->clear();
        while (board.activeCount() > 0) {
            auto options = removablePieces(board);
            if (options.empty()) return false;
            int pick = options[rng.range(0, (int)options.size() - 1)];
            if (removalOrder) removalOrder->push_back(board.piece(pick).id);
            board.setRemoved(pick);
        }
        return true;
    }

    double estimateDeadlockProbability(const Board& board, RNG& rng, int runs) {
        if (runs <= 0) return 0.0;
        int jammed = 0;
        for (int r = 0; r < runs; ++r) if (!greedyPlayout(board, rng)) ++jammed;
        return double(jammed) / runs;
    }

} // namespace lp
