// ========================= src/core/Detector.hpp =========================
#pragma once
#include "Board.hpp"

namespace lp {

    constexpr float kRayStepPx = 4.0f;
    constexpr int kRayMaxSteps = 2048;   // a ray that never leaves the screen counts as blocked

    struct RayResult {
        bool exited{ false };            // left the screen within kRayMaxSteps
        std::vector<int> hits;           // active pieces crossed, in order, without duplicates
    };

    // The lattice walk is valid when the piece sits on the lattice, faces along its own axis,
    // and every active piece it could meet is indexed on the lattice too.
    bool gridPathApplies(const Board& board, int index);

    // Is the exit lane of piece `index` obstructed by another active piece?
    bool isBlocked(const Board& board, int index);
    bool isBlockedGrid(const Board& board, int index);
    bool isBlockedRay(const Board& board, int index);

    // All active pieces in the exit lane (the piece's direct blockers).
    std::vector<int> blockersOf(const Board& board, int index);
    std::vector<int> blockersGrid(const Board& board, int index);
    RayResult marchRay(const Board& board, int index, bool stopAtFirstHit);

} // namespace lp
