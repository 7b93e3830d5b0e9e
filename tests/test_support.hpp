// tests/test_support.hpp
//
// Hand-built boards shared by the detector, graph, deadlock and session tests.
#pragma once

#include "core/Lattice.hpp"
#include "core/Board.hpp"

namespace lp_test_support {

// Lattice of the default 414x896 screen with 16 px blocks. Cells with |row|,|col| <= 3 are all members.
inline lp::Lattice defaultLattice() {
    lp::BoardSpec screen;
    auto safe = lp::makeSafeRect(lp::makeBoardRect(screen), 16.0f);
    return lp::Lattice(safe, 16.0f);
}

// Row-axis piece on column `col`, covering rows row and row + 1.
inline lp::Piece vertical(const lp::Lattice& lat, int id, int row, int col, lp::Direction dir) {
    return lp::makeLatticePiece(lat, id, lp::CellCoord{ row, col }, lp::CellCoord{ row + 1, col }, dir);
}

// Col-axis piece on row `row`, covering columns col and col + 1.
inline lp::Piece horizontal(const lp::Lattice& lat, int id, int row, int col, lp::Direction dir) {
    return lp::makeLatticePiece(lat, id, lp::CellCoord{ row, col }, lp::CellCoord{ row, col + 1 }, dir);
}

// Two pieces on column 0 facing each other: each blocks the other.
inline lp::Board facingPair(const lp::Lattice& lat) {
    std::vector<lp::Piece> ps;
    ps.push_back(vertical(lat, 0, -3, 0, lp::Direction::Down));
    ps.push_back(vertical(lat, 1, 2, 0, lp::Direction::Up));
    return lp::Board(ps, lp::BoardSpec{});
}

// Column 0, both facing up: piece 0 sits ahead of piece 1.
inline lp::Board chainPair(const lp::Lattice& lat) {
    std::vector<lp::Piece> ps;
    ps.push_back(vertical(lat, 0, -3, 0, lp::Direction::Up));
    ps.push_back(vertical(lat, 1, 0, 0, lp::Direction::Up));
    return lp::Board(ps, lp::BoardSpec{});
}

} // namespace lp_test_support
