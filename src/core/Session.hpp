// ========================= src/core/Session.hpp =========================
#pragma once
#include "Generator.hpp"
#include "Deadlock.hpp"

namespace lp {

    enum class TapOutcome : uint8_t { Removed, Blocked, Cleared, Deadlock, Ignored };
    const char* tapOutcomeName(TapOutcome t);

    // A level in play: overlay flags on the generated pieces, plus an incrementally updated graph.
    class PlaySession {
    public:
        explicit PlaySession(const GenerationResult& level);
        PlaySession(std::vector<Piece> pieces, const BoardSpec& screen);

        // Tries to send piece `id` off the board.
        TapOutcome tap(int id);

        const Board& board() const { return brd; }
        const DependencyGraph& graph() const { return dep; }
        const std::vector<int>& history() const { return removed; }
        int remaining() const { return brd.activeCount(); }
        int removableCount() const { return lp::removableCount(brd); }
        bool cleared() const { return brd.activeCount() == 0; }
        bool deadlocked() const { return !cleared() && isDeadlock(brd); }
        std::optional<int> hint() const { return dep.hint(); }

        // For effects that move pieces: edit through mutableBoard(), then revalidate().
        Board& mutableBoard() { return brd; }
        SolvabilityReport revalidate();

    private:
        Board brd;
        DependencyGraph dep;
        std::vector<int> removed;
    };

} // namespace lp
