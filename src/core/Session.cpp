// ========================= src/core/Session.cpp =========================
#include "Session.hpp"
#include "Detector.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace lp {

    const char* tapOutcomeName(TapOutcome t) {
        switch (t) {
        case TapOutcome::Removed: return "removed";
        case TapOutcome::Blocked: return "blocked";
        case TapOutcome::Cleared: return "cleared";
        case TapOutcome::Deadlock: return "deadlock";
        case TapOutcome::Ignored: return "ignored";
        }
        return "?";
    }

    PlaySession::PlaySession(const GenerationResult& level) :PlaySession(level.pieces, level.screen) {}

    PlaySession::PlaySession(std::vector<Piece> pieces, const BoardSpec& screen) :brd(std::move(pieces), screen) {
        dep = DependencyGraph::build(brd);
    }

    TapOutcome PlaySession::tap(int id) {
        int idx = brd.indexOfId(id);
        if (idx < 0) throw std::out_of_range("PlaySession::tap: unknown piece id");
        if (!brd.isActive(idx) || brd.stateOf(idx).animating) return TapOutcome::Ignored;
        if (isBlocked(brd, idx)) return TapOutcome::Blocked;

        brd.setRemoved(idx);
        dep.updateAfterRemoval(id);
        removed.push_back(id);

        if (cleared()) return TapOutcome::Cleared;
        if (isDeadlock(brd)) {
            spdlog::info("deadlock after {} moves, {} pieces left", removed.size(), brd.activeCount());
            return TapOutcome::Deadlock;
        }
        return TapOutcome::Removed;
    }

    SolvabilityReport PlaySession::revalidate() {
        brd.reindex();
        dep = DependencyGraph::build(brd);
        auto report = dep.validateSolvability();
        if (!report.solvable) spdlog::warn("board no longer solvable: {}", solvabilityReasonName(report.reason));
        return report;
    }

} // namespace lp
