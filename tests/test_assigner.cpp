// tests/test_assigner.cpp (doctest)

#include <doctest/doctest.h>

#include "core/Assigner.hpp"
#include "core/Placer.hpp"
#include "core/Detector.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <map>

using lp::Direction;
using lp::GenerationParameters;
using lp::Lattice;
using lp::RNG;

namespace lp_test_assigner {

struct Placed {
    Lattice lattice;
    std::vector<lp::Piece> pieces;
};

static Placed placeFor(const GenerationParameters& p, uint32_t seed) {
    Placed out{ lp_test_support::defaultLattice(), {} };
    RNG rng(seed);
    auto profile = lp::makeLayoutProfile(p, out.lattice, rng);
    out.pieces = lp::placeLayout(out.lattice, profile, p, lp::placementTarget(p, out.lattice), rng);
    return out;
}

// Replays `order` on a board of `pieces`; every piece must be free when its turn comes.
static bool replayClears(const std::vector<lp::Piece>& pieces, const std::vector<int>& order) {
    lp::Board board(pieces, lp::BoardSpec{});
    for (int id : order) {
        int idx = board.indexOfId(id);
        if (idx < 0 || !board.isActive(idx) || lp::isBlocked(board, idx)) return false;
        board.setRemoved(idx);
    }
    return board.activeCount() == 0;
}

} // namespace lp_test_assigner

TEST_CASE("Assigner: lane of a piece") {
    Lattice lat = lp_test_support::defaultLattice();
    auto v = lp_test_support::vertical(lat, 0, 1, -2, Direction::Up);
    auto h = lp_test_support::horizontal(lat, 1, 3, 0, Direction::Left);
    CHECK(lp::laneOf(v) == lp::LaneKey{ lp::Axis::Row, -2 });
    CHECK(lp::laneOf(h) == lp::LaneKey{ lp::Axis::Col, 3 });
}

TEST_CASE("Assigner: lenient peel yields a clearing order with one direction per lane") {
    GenerationParameters p = lp::parametersForLevel(3);
    auto placed = lp_test_assigner::placeFor(p, lp::levelSeed(3));
    REQUIRE(placed.pieces.size() > 50);

    RNG rng(5);
    lp::PeelAssigner peel(placed.lattice, placed.pieces, p, rng, true);
    int steps = 0;
    while (!peel.step()) ++steps;
    CHECK(peel.complete());
    CHECK_FALSE(peel.deadEnd());
    CHECK(placed.lattice.occupiedCount() == 0);
    CHECK(peel.order().size() + peel.dropped().size() == placed.pieces.size());

    std::vector<lp::Piece> kept;
    std::map<std::pair<int, int>, Direction> laneDirs;
    for (const auto& pc : placed.pieces) {
        if (std::find(peel.dropped().begin(), peel.dropped().end(), pc.id) != peel.dropped().end()) continue;
        CHECK(lp::axisOf(pc.direction) == pc.axis);
        auto lane = lp::laneOf(pc);
        auto key = std::make_pair(static_cast<int>(lane.axis), lane.index);
        auto it = laneDirs.find(key);
        if (it == laneDirs.end()) laneDirs.emplace(key, pc.direction);
        else CHECK(it->second == pc.direction);
        kept.push_back(pc);
    }
    CHECK(lp_test_assigner::replayClears(kept, peel.order()));
}

TEST_CASE("Assigner: strict peel on a small board") {
    GenerationParameters p = lp::parametersForLevel(1);
    auto placed = lp_test_assigner::placeFor(p, 11);
    REQUIRE_FALSE(placed.pieces.empty());

    RNG rng(11);
    std::vector<int> order;
    bool ok = lp::assignDirections(placed.lattice, placed.pieces, p, rng, &order);
    if (ok) {
        CHECK(order.size() == placed.pieces.size());
        CHECK(lp_test_assigner::replayClears(placed.pieces, order));
    }
    else {
        CHECK(order.size() < placed.pieces.size());
    }
}

TEST_CASE("Assigner: a piece walled in on both sides dead-ends") {
    GenerationParameters p;
    Lattice lat = lp_test_support::defaultLattice();
    std::vector<lp::Piece> pieces;
    pieces.push_back(lp_test_support::vertical(lat, 0, 0, 0, Direction::Up));
    pieces.push_back(lp_test_support::vertical(lat, 1, -2, 2, Direction::Up));
    for (const auto& pc : pieces) REQUIRE(lat.occupy(pc.cells, pc.id));
    // fixed obstacles above and below piece 0; their owners are not pieces, so they never clear
    std::array<lp::CellCoord, 2> above{ { {-3, 0}, {-2, 0} } };
    std::array<lp::CellCoord, 2> below{ { {2, 0}, {3, 0} } };
    REQUIRE(lat.occupy(above, 90));
    REQUIRE(lat.occupy(below, 91));

    SUBCASE("strict") {
        RNG rng(1);
        lp::PeelAssigner peel(lat, pieces, p, rng);
        while (!peel.step()) {}
        CHECK(peel.deadEnd());
        CHECK_FALSE(peel.complete());
        REQUIRE(peel.order().size() == 1);
        CHECK(peel.order()[0] == 1);
    }
    SUBCASE("lenient") {
        RNG rng(1);
        lp::PeelAssigner peel(lat, pieces, p, rng, true);
        while (!peel.step()) {}
        CHECK(peel.complete());
        REQUIRE(peel.dropped().size() == 1);
        CHECK(peel.dropped()[0] == 0);
        CHECK(peel.order() == std::vector<int>{ 1 });
    }
}

TEST_CASE("Assigner: outer pieces commit before central ones") {
    GenerationParameters p = lp::parametersForLevel(5);
    for (uint32_t seed = 0; seed < 50; ++seed) {
        CAPTURE(seed);
        Lattice lat = lp_test_support::defaultLattice();
        // both lanes are clear from the start; only the distance to the centre differs
        std::vector<lp::Piece> pieces{ lp_test_support::vertical(lat, 0, 0, 0, Direction::Up),
                                       lp_test_support::vertical(lat, 1, -8, -7, Direction::Up) };
        for (const auto& pc : pieces) REQUIRE(lat.occupy(pc.cells, pc.id));

        RNG rng(seed);
        lp::PeelAssigner peel(lat, pieces, p, rng);
        while (!peel.step()) {}
        REQUIRE(peel.complete());
        CHECK(peel.order() == std::vector<int>{ 1, 0 });
    }
}
