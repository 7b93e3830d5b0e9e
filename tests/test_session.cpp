// tests/test_session.cpp (doctest)

#include <doctest/doctest.h>

#include "core/Session.hpp"
#include "test_support.hpp"

#include <stdexcept>

using lp::Direction;
using lp::PlaySession;
using lp::TapOutcome;
using namespace lp_test_support;

TEST_CASE("Session: taps follow the blocking rules") {
    auto lat = defaultLattice();
    PlaySession s(chainPair(lat).pieces(), lp::BoardSpec{});
    CHECK(s.remaining() == 2);
    CHECK(s.removableCount() == 1);
    REQUIRE(s.hint());
    CHECK(*s.hint() == 0);

    CHECK(s.tap(1) == TapOutcome::Blocked);
    CHECK(s.remaining() == 2);
    CHECK(s.tap(0) == TapOutcome::Removed);
    CHECK(s.graph().node(s.graph().nodeOfId(1)).isRemovable);
    CHECK(s.tap(0) == TapOutcome::Ignored);
    CHECK(s.tap(1) == TapOutcome::Cleared);
    CHECK(s.cleared());
    CHECK_FALSE(s.deadlocked());
    CHECK(s.history() == std::vector<int>{ 0, 1 });

    CHECK_THROWS_AS(s.tap(17), std::out_of_range);
}

TEST_CASE("Session: clearing the last free piece reports a deadlock") {
    auto lat = defaultLattice();
    auto ps = facingPair(lat).pieces();
    ps.push_back(vertical(lat, 2, 0, 3, Direction::Up));
    PlaySession s(ps, lp::BoardSpec{});

    CHECK_FALSE(s.deadlocked());
    CHECK(s.tap(0) == TapOutcome::Blocked);
    CHECK(s.tap(2) == TapOutcome::Deadlock);
    CHECK(s.deadlocked());
    CHECK(s.remaining() == 2);
    CHECK_FALSE(s.hint());
}

TEST_CASE("Session: animating pieces ignore taps") {
    auto lat = defaultLattice();
    PlaySession s(chainPair(lat).pieces(), lp::BoardSpec{});
    s.mutableBoard().setAnimating(0, true);
    CHECK(s.tap(0) == TapOutcome::Ignored);
    s.mutableBoard().setAnimating(0, false);
    CHECK(s.tap(0) == TapOutcome::Removed);
}

TEST_CASE("Session: moving a piece is picked up by revalidate") {
    auto lat = defaultLattice();
    PlaySession s(chainPair(lat).pieces(), lp::BoardSpec{});
    // turn the front piece around so the pair faces each other
    lp::applyDirection(s.mutableBoard().mutablePiece(0), Direction::Down);
    auto report = s.revalidate();
    CHECK_FALSE(report.solvable);
    CHECK(report.reason == lp::SolvabilityReason::Cycle);
    CHECK(s.deadlocked());
}

TEST_CASE("Session: the recorded removal order plays a generated level to the end") {
    lp::GenOptions opt;
    opt.honorTimeBudget = false;
    auto level = lp::Generator(opt).makeLevel(3);
    PlaySession s(level);
    REQUIRE(level.total > 1);

    for (size_t k = 0; k < level.removalOrder.size(); ++k) {
        auto outcome = s.tap(level.removalOrder[k]);
        if (k + 1 < level.removalOrder.size()) CHECK(outcome == TapOutcome::Removed);
        else CHECK(outcome == TapOutcome::Cleared);
    }
    CHECK(s.cleared());
    CHECK(s.graph().liveCount() == 0);
}
