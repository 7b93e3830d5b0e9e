// ========================= src/core/Board.hpp =========================
#pragma once
#include "Geometry.hpp"
#include <unordered_map>

namespace lp {

    // Runtime overlay a game-state controller layers on top of generated pieces.
    struct PieceState {
        bool removed{ false };
        bool visible{ true };
        bool animating{ false };
    };

    // Generated pieces plus overlay flags and a lattice occupancy index for the active pieces.
    // Index semantics: indices are positions in pieces(); ids are Piece::id.
    class Board {
    public:
        Board() = default;
        Board(std::vector<Piece> pieces, const BoardSpec& screen);

        int size() const { return static_cast<int>(items.size()); }
        const std::vector<Piece>& pieces() const { return items; }
        const Piece& piece(int i) const { return items.at(i); }
        const PieceState& stateOf(int i) const { return states.at(i); }
        const BoardSpec& screen() const { return scr; }

        bool isActive(int i) const { return !states[i].removed && states[i].visible; }
        int activeCount() const;
        int indexOfId(int id) const;

        void setRemoved(int i, bool removed = true);
        void setVisible(int i, bool visible);
        void setAnimating(int i, bool animating) { states.at(i).animating = animating; }

        // Effects (shuffles, swaps) edit pieces in place, then call reindex().
        Piece& mutablePiece(int i) { return items.at(i); }
        void reindex();

        // Occupancy over active lattice pieces.
        int ownerAt(int row, int col) const;
        bool inLatticeBounds(int row, int col) const { return row >= minRow && row <= maxRow && col >= minCol && col <= maxCol; }
        bool latticeConsistent() const { return allOnLattice; }

    private:
        std::vector<Piece> items;
        std::vector<PieceState> states;
        BoardSpec scr;
        std::unordered_map<int64_t, int> occupancy;
        int minRow{ 0 }, maxRow{ -1 }, minCol{ 0 }, maxCol{ -1 };
        bool allOnLattice{ true };

        static int64_t key(int row, int col) { return (static_cast<int64_t>(row) << 32) ^ static_cast<uint32_t>(col); }
    };

} // namespace lp
