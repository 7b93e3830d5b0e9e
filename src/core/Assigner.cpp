// ========================= src/core/Assigner.cpp =========================
#include "Assigner.hpp"
#include <algorithm>
#include <cmath>

namespace lp {

    LaneKey laneOf(const Piece& p) {
        return LaneKey{ p.axis, p.axis == Axis::Row ? p.cells[0].col : p.cells[0].row };
    }

    // up/left = 0, down/right = 1 within the axis
    static int axisSide(Direction d) { return (d == Direction::Down || d == Direction::Right) ? 1 : 0; }

    static std::array<Direction, 2> axisDirections(Axis a) {
        if (a == Axis::Row) return { {Direction::Up, Direction::Down} };
        return { {Direction::Left, Direction::Right} };
    }

    PeelAssigner::PeelAssigner(Lattice& lat, std::vector<Piece>& ps, const GenerationParameters& p, RNG& r, bool drop)
        :lattice(lat), pieces(ps), params(p), rng(r), dropStuck(drop) {
        const Rect& safe = lattice.safeRect();
        Vec2 c = lattice.center();
        double halfDiag = std::max(1.0, 0.5 * std::hypot(safe.width, safe.height));
        int grid = std::max(1, params.localDirectionGrid);
        sectorCounts.assign(static_cast<size_t>(grid) * grid, {});
        laneDir.assign(static_cast<size_t>(lattice.bound() * 2 + 1) * 2, -1);

        distNorm.resize(pieces.size());
        sector.resize(pieces.size());
        for (size_t i = 0; i < pieces.size(); ++i) {
            Vec2 pc = pieces[i].center();
            distNorm[i] = std::min(1.0, std::hypot(pc.x - c.x, pc.y - c.y) / halfDiag);
            int sx = 0, sy = 0;
            if (safe.width > 0 && safe.height > 0) {
                sx = std::clamp(static_cast<int>((pc.x - safe.x) / safe.width * grid), 0, grid - 1);
                sy = std::clamp(static_cast<int>((pc.y - safe.y) / safe.height * grid), 0, grid - 1);
            }
            sector[i] = sy * grid + sx;
            remaining.push_back((int)i);
        }
        if (remaining.empty()) finished = true;
    }

    int PeelAssigner::laneSlot(const LaneKey& k) const {
        return (k.axis == Axis::Row ? 0 : lattice.bound() * 2 + 1) + (k.index + lattice.bound());
    }

    bool PeelAssigner::laneClear(const Piece& p, Direction d) const {
        int dr = 0, dc = 0; latticeDelta(d, dr, dc);
        // start from the cell that leads in direction d
        const CellCoord& lead = axisSide(d) == 0 ? p.cells[0] : p.cells[1];
        for (int r = lead.row + dr, c = lead.col + dc; lattice.inBounds(r, c); r += dr, c += dc) {
            int owner = lattice.owner(r, c);
            if (owner >= 0 && owner != p.id) return false;
        }
        return true;
    }

    double PeelAssigner::scoreOf(int i, Direction d, bool laneLocked) {
        int di = dirIndex(d);
        int committed = (int)commitOrder.size();
        double globalShare = committed > 0 ? double(dirCounts[di]) / committed : 0.0;
        double score = params.directionMix[di] - globalShare;

        const auto& sc = sectorCounts[sector[i]];
        double localShare = sc[kDirectionCount] > 0 ? double(sc[di]) / sc[kDirectionCount] : 0.0;
        score += params.localDirectionWeight * (params.directionMix[di] - localShare);

        if (!laneLocked) {
            int a = pieces[i].axis == Axis::Row ? 0 : 1;
            int lanes = laneLocks[a][0] + laneLocks[a][1];
            double laneShare = lanes > 0 ? double(laneLocks[a][axisSide(d)]) / lanes : 0.0;
            score += params.laneDirectionWeight * (0.5 - laneShare);
        }

        // outer pieces commit early, so the centre ends up buried deepest in the removal order
        score += distNorm[i] * params.depthFactor;
        score += (rng.next() - 0.5) * 0.1;
        return score;
    }

    void PeelAssigner::commit(int i, Direction d) {
        Piece& p = pieces[i];
        applyDirection(p, d);
        commitOrder.push_back(p.id);
        ++dirCounts[dirIndex(d)];
        auto& sc = sectorCounts[sector[i]];
        ++sc[dirIndex(d)]; ++sc[kDirectionCount];

        int slot = laneSlot(laneOf(p));
        if (laneDir[slot] < 0) {
            laneDir[slot] = dirIndex(d);
            ++laneLocks[p.axis == Axis::Row ? 0 : 1][axisSide(d)];
        }
        lattice.release(p.cells);
        remaining.erase(std::find(remaining.begin(), remaining.end(), i));
    }

    void PeelAssigner::drop(int i) {
        lattice.release(pieces[i].cells);
        droppedIds.push_back(pieces[i].id);
        remaining.erase(std::find(remaining.begin(), remaining.end(), i));
    }

    bool PeelAssigner::step() {
        if (finished) return true;

        int bestPiece = -1; Direction bestDir = Direction::Up; double bestScore = 0;
        for (int i : remaining) {
            const Piece& p = pieces[i];
            int locked = laneDir[laneSlot(laneOf(p))];
            for (Direction d : axisDirections(p.axis)) {
                if (locked >= 0 && locked != dirIndex(d)) continue;
                if (!laneClear(p, d)) continue;
                double s = scoreOf(i, d, locked >= 0);
                if (bestPiece < 0 || s > bestScore) { bestPiece = i; bestDir = d; bestScore = s; }
            }
        }

        if (bestPiece >= 0) {
            commit(bestPiece, bestDir);
        }
        else if (dropStuck) {
            // vacate the outermost stuck piece; it frees the longest stretch of other lanes
            auto it = std::max_element(remaining.begin(), remaining.end(), [&](int a, int b) { return distNorm[a] < distNorm[b]; });
            drop(*it);
        }
        else {
            stuck = true;
            finished = true;
            return true;
        }

        if (remaining.empty()) finished = true;
        return finished;
    }

    bool assignDirections(Lattice& lattice, std::vector<Piece>& pieces, const GenerationParameters& params, RNG& rng,
                          std::vector<int>* removalOrder) {
        PeelAssigner peel(lattice, pieces, params, rng);
        while (!peel.step()) {}
        if (removalOrder) *removalOrder = peel.order();
        return peel.complete();
    }

} // namespace lp
