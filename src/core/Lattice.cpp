// ========================= src/core/Lattice.cpp =========================
#include "Lattice.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <stdexcept>

namespace lp {

    static const int kNeighbor[4][2] = { {1,0},{-1,0},{0,1},{0,-1} };

    Lattice::Lattice(const Rect& safeRect, float shortSide) :safe(safeRect), shortPx(shortSide) {
        if (shortSide <= 0) throw std::invalid_argument("Lattice: short side must be positive");
        float longSide = shortSide * (BlockSizes::kLength / BlockSizes::kWidth);
        float baseGap = std::max(4.0f, std::round(shortSide * 0.35f));
        float cellGap = std::max(baseGap, std::round(longSide - shortSide * 2));
        cellStepPx = shortSide + cellGap;
        stepPx = cellStepPx / std::sqrt(2.0f);
        cx = safe.x + safe.width * 0.5f;
        cy = safe.y + safe.height * 0.5f;

        // |col - row| <= w/2step and |col + row| <= h/2step, so |row|,|col| <= (w+h)/4step
        bnd = static_cast<int>(std::ceil((safe.width + safe.height) / (4.0f * stepPx)));
        side = bnd * 2 + 1;
        grid.assign(static_cast<size_t>(side) * side, Cell{});
        boundary.assign(grid.size(), 0);

        for (int row = -bnd; row <= bnd; ++row) {
            for (int col = -bnd; col <= bnd; ++col) {
                Cell& c = grid[index(row, col)];
                c.row = row; c.col = col; c.pos = toPixel(row, col);
                c.valid = safe.width > 0 && safe.height > 0 && safe.contains(c.pos.x, c.pos.y);
                if (c.valid) members.push_back(CellCoord{ row, col });
            }
        }
        for (const auto& m : members) refreshBoundary(m.row, m.col);
    }

    Vec2 Lattice::toPixel(int row, int col) const {
        return Vec2{ cx + (col - row) * stepPx, cy + (col + row) * stepPx };
    }

    const Cell* Lattice::cell(int row, int col) const {
        if (!isCell(row, col)) return nullptr;
        return &grid[index(row, col)];
    }

    bool Lattice::isOccupied(int row, int col) const {
        const Cell* c = cell(row, col);
        return c && c->occupied();
    }

    int Lattice::owner(int row, int col) const {
        const Cell* c = cell(row, col);
        return c ? c->owner : -1;
    }

    bool Lattice::occupy(const std::array<CellCoord, 2>& cells, int pieceId) {
        if (!areAdjacent(cells[0], cells[1])) return false;
        for (const auto& cc : cells) {
            if (!isCell(cc.row, cc.col) || grid[index(cc.row, cc.col)].occupied()) return false;
        }
        for (const auto& cc : cells) { grid[index(cc.row, cc.col)].owner = pieceId; ++occupied; }
        for (const auto& cc : cells) {
            refreshBoundary(cc.row, cc.col);
            for (const auto& n : kNeighbor) refreshBoundary(cc.row + n[0], cc.col + n[1]);
        }
        return true;
    }

    void Lattice::release(const std::array<CellCoord, 2>& cells) {
        for (const auto& cc : cells) {
            if (!isCell(cc.row, cc.col)) continue;
            Cell& c = grid[index(cc.row, cc.col)];
            if (c.occupied()) { c.owner = -1; --occupied; }
        }
        for (const auto& cc : cells) {
            refreshBoundary(cc.row, cc.col);
            for (const auto& n : kNeighbor) refreshBoundary(cc.row + n[0], cc.col + n[1]);
        }
    }

    void Lattice::refreshBoundary(int row, int col) {
        if (!isCell(row, col)) return;
        int idx = index(row, col);
        if (grid[idx].occupied()) { boundary[idx] = 0; return; }
        bool edge = false;
        for (const auto& n : kNeighbor) {
            int r = row + n[0], c = col + n[1];
            if (!isCell(r, c) || grid[index(r, c)].occupied()) { edge = true; break; }
        }
        boundary[idx] = edge ? 1 : 0;
    }

    bool Lattice::isBoundary(int row, int col) const { return isCell(row, col) && boundary[index(row, col)] != 0; }

    std::vector<CellCoord> Lattice::boundaryCells() const {
        std::vector<CellCoord> out;
        for (const auto& m : members) if (boundary[index(m.row, m.col)]) out.push_back(m);
        return out;
    }

    bool areAdjacent(const CellCoord& a, const CellCoord& b) {
        return std::abs(a.row - b.row) + std::abs(a.col - b.col) == 1;
    }

    Axis axisOfPair(const CellCoord& a, const CellCoord& b) { return a.row != b.row ? Axis::Row : Axis::Col; }

    Piece makeLatticePiece(const Lattice& lattice, int id, CellCoord a, CellCoord b, Direction dir) {
        if (!areAdjacent(a, b)) throw std::invalid_argument("makeLatticePiece: cells are not adjacent");
        if (b.row < a.row || b.col < a.col) std::swap(a, b);
        Piece p;
        p.id = id;
        p.cells = { a, b };
        p.axis = axisOfPair(a, b);
        p.hasLattice = true;
        p.shortSide = lattice.shortSide();
        Vec2 pa = lattice.toPixel(a.row, a.col), pb = lattice.toPixel(b.row, b.col);
        Vec2 mid{ (pa.x + pb.x) * 0.5f, (pa.y + pb.y) * 0.5f };
        p.rect.x = mid.x; p.rect.y = mid.y;
        if (axisOf(dir) != p.axis) throw std::invalid_argument("makeLatticePiece: direction does not match the cell axis");
        applyDirection(p, dir);
        return p;
    }

    void applyDirection(Piece& p, Direction dir) {
        Vec2 c{ p.rect.x + p.rect.width * 0.5f, p.rect.y + p.rect.height * 0.5f };
        auto dims = pieceDimensions(dir, p.shortSide);
        p.direction = dir;
        p.rect.width = dims.bboxWidth;
        p.rect.height = dims.bboxHeight;
        p.rect.x = c.x - dims.bboxWidth * 0.5f;
        p.rect.y = c.y - dims.bboxHeight * 0.5f;
    }

} // namespace lp
