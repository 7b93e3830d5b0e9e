// ========================= src/core/Assigner.hpp =========================
#pragma once
#include "Lattice.hpp"
#include "Difficulty.hpp"
#include "Random.hpp"

namespace lp {

    // Lane a piece slides along: the lattice column for row-axis pieces, the row for col-axis pieces.
    struct LaneKey {
        Axis axis{ Axis::Row };
        int index{ 0 };
        bool operator==(const LaneKey& o) const { return axis == o.axis && index == o.index; }
    };
    LaneKey laneOf(const Piece& p);

    // "Peel" direction assignment. Each step commits one piece whose exit lane holds no cell of a
    // still-unassigned piece, then vacates its cells. A lane keeps the direction of its first commit.
    // Commit order is therefore a valid removal order for the finished board.
    //
    // Pre: pieces were placed on `lattice` with owner == piece id. Post (complete()): every piece has a
    // direction on its own axis; the lattice is empty. With dropStuck, pieces that can never get a clear
    // lane are vacated and reported in dropped() instead of ending the run.
    class PeelAssigner {
    public:
        PeelAssigner(Lattice& lattice, std::vector<Piece>& pieces, const GenerationParameters& params, RNG& rng, bool dropStuck = false);

        bool step();                     // true once finished
        bool done() const { return finished; }
        bool deadEnd() const { return finished && stuck; }
        bool complete() const { return finished && !stuck; }

        const std::vector<int>& order() const { return commitOrder; }
        const std::vector<int>& dropped() const { return droppedIds; }

    private:
        Lattice& lattice; std::vector<Piece>& pieces; const GenerationParameters& params; RNG& rng;
        bool dropStuck{ false }; bool finished{ false }; bool stuck{ false };

        std::vector<double> distNorm;
        std::vector<int> sector;
        std::vector<int> remaining;
        std::vector<int> commitOrder, droppedIds;

        std::array<int, kDirectionCount> dirCounts{ {0,0,0,0} };
        std::vector<std::array<int, kDirectionCount + 1>> sectorCounts; // last slot = total
        std::array<std::array<int, 2>, 2> laneLocks{ { {{0,0}}, {{0,0}} } }; // [axis][0 = up/left, 1 = down/right]
        std::vector<int> laneDir;        // per lane slot: -1 free, else Direction

        int laneSlot(const LaneKey& k) const;
        bool laneClear(const Piece& p, Direction d) const;
        double scoreOf(int i, Direction d, bool laneLocked);
        void commit(int i, Direction d);
        void drop(int i);
    };

    // Runs the peel to completion. Returns false on a dead end.
    bool assignDirections(Lattice& lattice, std::vector<Piece>& pieces, const GenerationParameters& params, RNG& rng,
                          std::vector<int>* removalOrder = nullptr);

} // namespace lp
