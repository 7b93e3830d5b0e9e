// ========================= src/core/Placer.cpp =========================
#include "Placer.hpp"
#include <algorithm>
#include <cmath>

namespace lp {

    static constexpr double kPi = 3.14159265358979323846;
    static constexpr double kWeightFloor = 0.2;

    double LayoutProfile::weight(Vec2 p) const {
        double dx = p.x - center.x, dy = p.y - center.y;
        double r = std::sqrt(dx * dx + dy * dy) / (maxR > 0 ? maxR : 1.0);
        switch (kind) {
        case LayoutProfileKind::Ring: {
            double d = r - ringBand;
            return std::exp(-(d * d) / (2.0 * ringSigma * ringSigma)) + kWeightFloor;
        }
        case LayoutProfileKind::DiagonalBand: {
            double ny = dx * std::sin(rotation) + dy * std::cos(rotation);
            return std::max(kWeightFloor, 1.0 - std::fabs(ny) / bandWidth);
        }
        case LayoutProfileKind::TwinLumps: {
            double sigma = maxR * 0.35;
            double d1 = std::hypot(p.x - (center.x - lumpOffset), p.y - (center.y + lumpOffset * 0.3));
            double d2 = std::hypot(p.x - (center.x + lumpOffset), p.y - (center.y - lumpOffset * 0.3));
            return std::max(kWeightFloor, std::exp(-(d1 * d1) / (2 * sigma * sigma)) + std::exp(-(d2 * d2) / (2 * sigma * sigma)));
        }
        case LayoutProfileKind::HollowCenter: return std::max(kWeightFloor, r);
        case LayoutProfileKind::Uniform: break;
        }
        return 1.0;
    }

    LayoutProfile makeLayoutProfile(const GenerationParameters& params, const Lattice& lattice, RNG& rng) {
        LayoutProfile prof;
        const Rect& safe = lattice.safeRect();
        if (!params.layoutProfiles.empty()) {
            int pick = static_cast<int>(rng.next() * params.layoutProfiles.size());
            prof.kind = params.layoutProfiles[std::min(pick, (int)params.layoutProfiles.size() - 1)];
        }
        Vec2 c = lattice.center();
        prof.center.x = c.x + static_cast<float>((rng.next() - 0.5) * safe.width * 0.2);
        prof.center.y = c.y + static_cast<float>((rng.next() - 0.5) * safe.height * 0.2);
        prof.maxR = std::max(safe.width, safe.height) * 0.5f;
        prof.rotation = static_cast<float>(rng.next() * kPi * 2);
        prof.ringBand = static_cast<float>(0.55 + rng.next() * 0.2);
        prof.ringSigma = 0.12f;
        prof.bandWidth = std::max(1.0f, static_cast<float>(prof.maxR * (0.18 + rng.next() * 0.08)));
        prof.lumpOffset = static_cast<float>(prof.maxR * (0.35 + rng.next() * 0.1));
        return prof;
    }

    int placementTarget(const GenerationParameters& params, const Lattice& lattice) {
        int maxPossible = lattice.maxPieces();
        int fillTarget = static_cast<int>(std::floor(maxPossible * params.targetFillRate));
        if (params.forceFillRate) return std::max(0, std::min(maxPossible, fillTarget));
        return std::max(0, std::min({ params.pieceCountMax, maxPossible, fillTarget }));
    }

    LayoutPlacer::LayoutPlacer(Lattice& lat, const LayoutProfile& profile, const GenerationParameters& p, int target, RNG& r)
        :lattice(lat), params(p), rng(r), targetCount(target) {
        const auto& cells = lattice.cells();
        int side = lattice.bound() * 2 + 1;
        cellSlot.assign(static_cast<size_t>(side) * side, -1);
        weights.resize(cells.size());
        for (size_t i = 0; i < cells.size(); ++i) {
            const auto& c = cells[i];
            cellSlot[(c.row + lattice.bound()) * side + (c.col + lattice.bound())] = (int)i;
            weights[i] = profile.weight(lattice.toPixel(c.row, c.col)) + (rng.next() - 0.5) * 0.1;
        }
        std::vector<int> idx(cells.size());
        for (size_t i = 0; i < idx.size(); ++i) idx[i] = (int)i;
        std::stable_sort(idx.begin(), idx.end(), [&](int a, int b) { return weights[a] > weights[b]; });
        order.reserve(idx.size());
        for (int i : idx) order.push_back(cells[i]);
        if (targetCount <= 0 || cells.size() < 2) pass = 2;
    }

    int LayoutPlacer::slotOf(int row, int col) const {
        if (!lattice.isCell(row, col)) return -1;
        int side = lattice.bound() * 2 + 1;
        return cellSlot[(row + lattice.bound()) * side + (col + lattice.bound())];
    }

    void LayoutPlacer::tryPlaceFrom(const CellCoord& c) {
        if (lattice.isOccupied(c.row, c.col)) return;
        static const int kNeighbor[4][2] = { {1,0},{-1,0},{0,1},{0,-1} };
        int total = axisCounts[0] + axisCounts[1];
        int best = -1; double bestScore = 0;
        for (int k = 0; k < 4; ++k) {
            int r = c.row + kNeighbor[k][0], cc = c.col + kNeighbor[k][1];
            int slot = slotOf(r, cc);
            if (slot < 0 || lattice.isOccupied(r, cc)) continue;
            int axis = kNeighbor[k][0] != 0 ? 0 : 1;
            // positive when this axis is under-represented so far
            double axisBias = total > 0 ? 0.5 - double(axisCounts[axis]) / total : 0.0;
            double score = weights[slot] + axisBias * params.axisBalanceWeight + (rng.next() - 0.5) * 0.05;
            if (best < 0 || score > bestScore) { best = k; bestScore = score; }
        }
        if (best < 0) return;

        CellCoord n{ c.row + kNeighbor[best][0], c.col + kNeighbor[best][1] };
        Axis axis = axisOfPair(c, n);
        int id = (int)placed.size();
        Piece piece = makeLatticePiece(lattice, id, c, n, axis == Axis::Row ? Direction::Up : Direction::Right);
        if (!lattice.occupy(piece.cells, id)) return;
        ++axisCounts[axis == Axis::Row ? 0 : 1];
        placed.push_back(piece);
    }

    void LayoutPlacer::beginMopUp() {
        order.clear();
        for (const auto& c : lattice.cells()) if (!lattice.isOccupied(c.row, c.col)) order.push_back(c);
        rng.shuffle(order);
        cursor = 0;
    }

    bool LayoutPlacer::step(int budget) {
        while (!done() && budget-- > 0) {
            if ((int)placed.size() >= targetCount) { pass = 2; break; }
            if (cursor >= order.size()) {
                ++pass;
                if (pass == 1) beginMopUp();
                continue;
            }
            tryPlaceFrom(order[cursor++]);
        }
        return done();
    }

    std::vector<Piece> placeLayout(Lattice& lattice, const LayoutProfile& profile, const GenerationParameters& params, int targetCount, RNG& rng) {
        LayoutPlacer placer(lattice, profile, params, targetCount, rng);
        while (!placer.step()) {}
        return placer.takePieces();
    }

} // namespace lp
