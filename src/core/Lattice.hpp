// ========================= src/core/Lattice.hpp =========================
#pragma once
#include "Geometry.hpp"
#include <vector>

namespace lp {

    struct Cell {
        int row{ 0 }; int col{ 0 };
        Vec2 pos;                // pixel center
        bool valid{ false };     // lattice member (inside the safe rect)
        int owner{ -1 };         // piece id, -1 = free

        bool occupied() const { return owner >= 0; }
    };

    // 45-degree rotated square lattice laid over the safe rect.
    //   x = cx + (col - row) * step,  y = cy + (col + row) * step
    // Storage is a flat array over [-bound, bound]^2; cells outside the safe rect are kept but invalid.
    class Lattice {
    public:
        Lattice() = default;
        Lattice(const Rect& safeRect, float shortSide);

        int bound() const { return bnd; }
        float step() const { return stepPx; }
        float cellStep() const { return cellStepPx; }
        float shortSide() const { return shortPx; }
        const Rect& safeRect() const { return safe; }
        Vec2 center() const { return Vec2{ cx, cy }; }

        bool inBounds(int row, int col) const { return row >= -bnd && row <= bnd && col >= -bnd && col <= bnd; }
        bool isCell(int row, int col) const { return inBounds(row, col) && grid[index(row, col)].valid; }
        const Cell* cell(int row, int col) const;
        bool isOccupied(int row, int col) const;
        int owner(int row, int col) const;
        Vec2 toPixel(int row, int col) const;

        // Both cells must be free, adjacent lattice members. Returns false and changes nothing otherwise.
        bool occupy(const std::array<CellCoord, 2>& cells, int pieceId);
        void release(const std::array<CellCoord, 2>& cells);

        const std::vector<CellCoord>& cells() const { return members; }
        int cellCount() const { return static_cast<int>(members.size()); }
        int maxPieces() const { return cellCount() / 2; }
        int occupiedCount() const { return occupied; }

        // Free cells touching the lattice edge or an occupied cell.
        bool isBoundary(int row, int col) const;
        std::vector<CellCoord> boundaryCells() const;

    private:
        Rect safe; float shortPx{ 0 }; float stepPx{ 1 }; float cellStepPx{ 0 }; float cx{ 0 }, cy{ 0 };
        int bnd{ 0 }; int side{ 1 }; int occupied{ 0 };
        std::vector<Cell> grid;
        std::vector<char> boundary;
        std::vector<CellCoord> members;

        int index(int row, int col) const { return (row + bnd) * side + (col + bnd); }
        void refreshBoundary(int row, int col);
    };

    bool areAdjacent(const CellCoord& a, const CellCoord& b);
    Axis axisOfPair(const CellCoord& a, const CellCoord& b);

    // Builds a lattice-anchored piece; rect is the bbox around the midpoint of the two cells.
    Piece makeLatticePiece(const Lattice& lattice, int id, CellCoord a, CellCoord b, Direction dir);
    // The only mutation point for a piece's facing: sets direction and re-derives the bbox around the same center.
    // Callers keep axisOf(dir) == p.axis for lattice pieces; a mismatch makes detectors fall back to ray marching.
    void applyDirection(Piece& p, Direction dir);

} // namespace lp
