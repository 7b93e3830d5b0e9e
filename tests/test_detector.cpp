// tests/test_detector.cpp (doctest)

#include <doctest/doctest.h>

#include "core/Detector.hpp"
#include "core/Generator.hpp"
#include "test_support.hpp"

using lp::Board;
using lp::Direction;
using namespace lp_test_support;

TEST_CASE("Detector: a lone piece always leaves") {
    auto lat = defaultLattice();
    for (Direction d : { Direction::Up, Direction::Down }) {
        Board b({ vertical(lat, 0, 0, 0, d) }, lp::BoardSpec{});
        CHECK(lp::gridPathApplies(b, 0));
        CHECK_FALSE(lp::isBlocked(b, 0));
        CHECK_FALSE(lp::isBlockedRay(b, 0));
        CHECK(lp::blockersOf(b, 0).empty());
        auto ray = lp::marchRay(b, 0, false);
        CHECK(ray.exited);
        CHECK(ray.hits.empty());
    }
    for (Direction d : { Direction::Left, Direction::Right }) {
        Board b({ horizontal(lat, 0, 1, -1, d) }, lp::BoardSpec{});
        CHECK_FALSE(lp::isBlocked(b, 0));
        CHECK_FALSE(lp::isBlockedRay(b, 0));
    }
}

TEST_CASE("Detector: two pieces facing each other in one lane are both blocked") {
    auto lat = defaultLattice();
    Board b = facingPair(lat);
    CHECK(lp::isBlocked(b, 0));
    CHECK(lp::isBlocked(b, 1));
    CHECK(lp::isBlockedRay(b, 0));
    CHECK(lp::isBlockedRay(b, 1));
    CHECK(lp::blockersOf(b, 0) == std::vector<int>{ 1 });
    CHECK(lp::blockersOf(b, 1) == std::vector<int>{ 0 });

    // once one of them is gone the other is free
    b.setRemoved(1);
    CHECK_FALSE(lp::isBlocked(b, 0));
    CHECK_FALSE(lp::isBlocked(b, 1));   // removed pieces are never blocked
}

TEST_CASE("Detector: back to back pieces are both free") {
    auto lat = defaultLattice();
    Board b({ vertical(lat, 0, -3, 0, Direction::Up), vertical(lat, 1, 2, 0, Direction::Down) }, lp::BoardSpec{});
    CHECK_FALSE(lp::isBlocked(b, 0));
    CHECK_FALSE(lp::isBlocked(b, 1));
    CHECK_FALSE(lp::isBlockedRay(b, 0));
    CHECK_FALSE(lp::isBlockedRay(b, 1));
}

TEST_CASE("Detector: a crossing piece blocks the lane it covers, not its neighbours") {
    auto lat = defaultLattice();
    // horizontal piece on row -3 covering columns -1 and 0
    std::vector<lp::Piece> ps{ vertical(lat, 0, 0, 0, Direction::Up), vertical(lat, 1, 0, 1, Direction::Up),
                               vertical(lat, 2, 0, -1, Direction::Up), horizontal(lat, 3, -3, -1, Direction::Left) };
    Board b(ps, lp::BoardSpec{});
    CHECK(lp::isBlocked(b, 0));
    CHECK_FALSE(lp::isBlocked(b, 1));
    CHECK(lp::isBlocked(b, 2));
    for (int i = 0; i < b.size(); ++i) CHECK(lp::isBlockedRay(b, i) == lp::isBlockedGrid(b, i));
}

TEST_CASE("Detector: hidden pieces neither block nor get blocked") {
    auto lat = defaultLattice();
    Board b = chainPair(lat);
    CHECK(lp::isBlocked(b, 1));
    b.setVisible(0, false);
    CHECK_FALSE(lp::isBlocked(b, 1));
    CHECK_FALSE(lp::isBlocked(b, 0));
}

TEST_CASE("Detector: off-lattice pieces fall back to the ray") {
    auto lat = defaultLattice();
    auto ps = chainPair(lat).pieces();
    ps[0].hasLattice = false;
    Board b(ps, lp::BoardSpec{});
    CHECK_FALSE(b.latticeConsistent());
    CHECK_FALSE(lp::gridPathApplies(b, 1));
    CHECK(lp::isBlocked(b, 1));
    CHECK_FALSE(lp::isBlocked(b, 0));
    CHECK(lp::blockersOf(b, 1) == std::vector<int>{ 0 });
}

TEST_CASE("Detector: lattice walk and ray march agree on generated boards") {
    lp::GenOptions opt;
    opt.honorTimeBudget = false;
    lp::Generator gen(opt);
    for (int level : { 1, 3 }) {
        auto g = gen.makeLevel(level);
        REQUIRE(g.total > 0);
        Board b(g.pieces, g.screen);
        for (int i = 0; i < b.size(); ++i) {
            CHECK(lp::gridPathApplies(b, i));
            CHECK(lp::isBlockedGrid(b, i) == lp::isBlockedRay(b, i));
        }
    }
}
