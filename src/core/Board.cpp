// ========================= src/core/Board.cpp =========================
#include "Board.hpp"
#include <algorithm>

namespace lp {

    Board::Board(std::vector<Piece> pieces, const BoardSpec& screen) :items(std::move(pieces)), states(items.size()), scr(screen) {
        reindex();
    }

    int Board::activeCount() const {
        int n = 0;
        for (int i = 0; i < size(); ++i) if (isActive(i)) ++n;
        return n;
    }

    int Board::indexOfId(int id) const {
        if (id >= 0 && id < size() && items[id].id == id) return id;
        for (int i = 0; i < size(); ++i) if (items[i].id == id) return i;
        return -1;
    }

    void Board::setRemoved(int i, bool removed) {
        states.at(i).removed = removed;
        reindex();
    }

    void Board::setVisible(int i, bool visible) {
        states.at(i).visible = visible;
        reindex();
    }

    void Board::reindex() {
        occupancy.clear();
        allOnLattice = true;
        bool any = false;
        for (int i = 0; i < size(); ++i) {
            const Piece& p = items[i];
            // bounds cover removed pieces too, so a lane walk always spans the full lattice
            if (p.hasLattice) {
                for (const auto& c : p.cells) {
                    if (!any) { minRow = maxRow = c.row; minCol = maxCol = c.col; any = true; }
                    minRow = std::min(minRow, c.row); maxRow = std::max(maxRow, c.row);
                    minCol = std::min(minCol, c.col); maxCol = std::max(maxCol, c.col);
                }
            }
            if (!isActive(i)) continue;
            if (!p.hasLattice) { allOnLattice = false; continue; }
            for (const auto& c : p.cells) occupancy[key(c.row, c.col)] = i;
        }
        if (!any) { minRow = minCol = 0; maxRow = maxCol = -1; }
    }

    int Board::ownerAt(int row, int col) const {
        auto it = occupancy.find(key(row, col));
        return it == occupancy.end() ? -1 : it->second;
    }

} // namespace lp
