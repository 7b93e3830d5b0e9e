// ========================= src/core/Detector.cpp =========================
#include "Detector.hpp"
#include <algorithm>

namespace lp {

    bool gridPathApplies(const Board& board, int index) {
        const Piece& p = board.piece(index);
        return p.hasLattice && axisOf(p.direction) == p.axis && board.latticeConsistent();
    }

    static const CellCoord& leadCell(const Piece& p) {
        bool forward = p.direction == Direction::Down || p.direction == Direction::Right;
        return forward ? p.cells[1] : p.cells[0];
    }

    // walks cells strictly ahead; visit returns true to stop early
    template <typename Visit>
    static void walkLane(const Board& board, int index, Visit visit) {
        const Piece& p = board.piece(index);
        int dr = 0, dc = 0; latticeDelta(p.direction, dr, dc);
        const CellCoord& lead = leadCell(p);
        for (int r = lead.row + dr, c = lead.col + dc; board.inLatticeBounds(r, c); r += dr, c += dc) {
            int owner = board.ownerAt(r, c);
            if (owner >= 0 && owner != index && visit(owner)) return;
        }
    }

    bool isBlockedGrid(const Board& board, int index) {
        bool blocked = false;
        walkLane(board, index, [&](int) { blocked = true; return true; });
        return blocked;
    }

    std::vector<int> blockersGrid(const Board& board, int index) {
        std::vector<int> out;
        walkLane(board, index, [&](int owner) {
            if (std::find(out.begin(), out.end(), owner) == out.end()) out.push_back(owner);
            return false;
        });
        return out;
    }

    RayResult marchRay(const Board& board, int index, bool stopAtFirstHit) {
        RayResult res;
        const Piece& self = board.piece(index);
        std::vector<std::pair<int, HitRect>> others;
        for (int i = 0; i < board.size(); ++i) {
            if (i == index || !board.isActive(i)) continue;
            others.emplace_back(i, hitRectOf(board.piece(i)));
        }

        Vec2 v = directionVector(self.direction);
        auto dims = pieceDimensions(self.direction, self.shortSide);
        Vec2 c = self.center();
        float offset = dims.longSide * 0.5f + 2.0f;
        float x = c.x + v.x * offset, y = c.y + v.y * offset;
        const float w = board.screen().width, h = board.screen().height;

        for (int stepCount = 0; stepCount < kRayMaxSteps; ++stepCount) {
            if (x < 0 || x > w || y < 0 || y > h) { res.exited = true; return res; }
            for (const auto& o : others) {
                if (!o.second.contains(x, y)) continue;
                if (std::find(res.hits.begin(), res.hits.end(), o.first) == res.hits.end()) res.hits.push_back(o.first);
                if (stopAtFirstHit) return res;
            }
            x += v.x * kRayStepPx; y += v.y * kRayStepPx;
        }
        return res;
    }

    bool isBlockedRay(const Board& board, int index) {
        auto res = marchRay(board, index, true);
        return !res.hits.empty() || !res.exited;
    }

    bool isBlocked(const Board& board, int index) {
        if (!board.isActive(index)) return false;
        return gridPathApplies(board, index) ? isBlockedGrid(board, index) : isBlockedRay(board, index);
    }

    std::vector<int> blockersOf(const Board& board, int index) {
        if (gridPathApplies(board, index)) return blockersGrid(board, index);
        return marchRay(board, index, false).hits;
    }

} // namespace lp
