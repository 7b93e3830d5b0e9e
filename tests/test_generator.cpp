// tests/test_generator.cpp (doctest)
//
// All generation here runs with honorTimeBudget = false, so the attempt budget alone bounds a
// level and the same (level, salt) gives the same board on any machine.

#include <doctest/doctest.h>

#include "core/Generator.hpp"
#include "core/Detector.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>

using lp::GenerationResult;
using lp::GenIssue;
using lp::GenOptions;
using lp::Generator;

namespace lp_test_generator {

static GenOptions reproducible() {
    GenOptions o;
    o.honorTimeBudget = false;
    return o;
}

// Structural guarantees every returned board must meet.
static void checkBoard(const GenerationResult& g) {
    REQUIRE(g.total == (int)g.pieces.size());
    lp::Lattice lat(g.safeRect, g.pieces.empty() ? 16.0f : g.pieces.front().shortSide);

    std::set<std::pair<int, int>> cells;
    for (int i = 0; i < g.total; ++i) {
        const auto& p = g.pieces[i];
        CHECK(p.id == i);
        CHECK(p.hasLattice);
        CHECK(lp::axisOf(p.direction) == p.axis);
        for (const auto& c : p.cells) {
            CHECK(lat.isCell(c.row, c.col));
            CHECK(cells.insert({ c.row, c.col }).second);
        }
    }

    // eroded bodies never overlap
    for (int i = 0; i < g.total; ++i) {
        auto hi = lp::hitRectOf(g.pieces[i]);
        for (int j = i + 1; j < g.total; ++j) {
            CAPTURE(i); CAPTURE(j);
            CHECK_FALSE(lp::hitRectsOverlap(hi, lp::hitRectOf(g.pieces[j])));
        }
    }

    // removal order is a permutation of the ids that clears the board one free piece at a time
    std::vector<int> sorted = g.removalOrder;
    std::sort(sorted.begin(), sorted.end());
    REQUIRE((int)sorted.size() == g.total);
    for (int i = 0; i < g.total; ++i) CHECK(sorted[i] == i);

    lp::Board board(g.pieces, g.screen);
    for (int id : g.removalOrder) {
        int idx = board.indexOfId(id);
        REQUIRE(idx >= 0);
        CHECK_FALSE(lp::isBlocked(board, idx));
        board.setRemoved(idx);
    }
    CHECK(board.activeCount() == 0);
}

} // namespace lp_test_generator

TEST_CASE("Generator: tutorial level") {
    auto g = Generator(lp_test_generator::reproducible()).makeLevel(1);
    CHECK(g.level == 1);
    CHECK(g.solvable);
    CHECK(g.total >= 1);
    CHECK(g.total <= 6);
    CHECK(g.difficultyLabel == lp::labelForScore(g.difficultyScore));
    CHECK(g.diag.attempts >= 1);
    CHECK_FALSE(g.diag.has(GenIssue::BoardTooSmall));
    lp_test_generator::checkBoard(g);
}

TEST_CASE("Generator: boards under the piece count floor are flagged") {
    auto params = lp::parametersForLevel(1);
    params.pieceCountMin = 50;  // the tutorial still caps placement at six pieces
    auto g = Generator(lp_test_generator::reproducible()).makeOne(params);
    CHECK(g.total <= 6);
    CHECK(g.diag.has(GenIssue::PlacementShortfall));
    lp_test_generator::checkBoard(g);
}

TEST_CASE("Generator: curve levels are solvable and structurally valid") {
    Generator gen(lp_test_generator::reproducible());
    for (int level : { 2, 3, 5 }) {
        auto g = gen.makeLevel(level);
        CAPTURE(level);
        CHECK(g.solvable);
        CHECK(g.total > 50);
        CHECK(g.diag.fillRate > 0.5);
        CHECK(g.diag.attempts <= lp::parametersForLevel(level).maxAttempts + 1);
        lp_test_generator::checkBoard(g);

        // recorded depths match the graph of the returned board
        auto graph = lp::DependencyGraph::build(lp::Board(g.pieces, g.screen));
        for (int v = 0; v < graph.size(); ++v) CHECK(g.pieces[graph.node(v).pieceIndex].depth == graph.node(v).depth);
        CHECK(g.diag.maxDepth == graph.stats().maxDepth);
    }
}

TEST_CASE("Generator: same level and salt give the same board") {
    Generator gen(lp_test_generator::reproducible());
    auto a = gen.makeLevel(3);
    auto b = gen.makeLevel(3);
    REQUIRE(a.total == b.total);
    CHECK(a.removalOrder == b.removalOrder);
    CHECK(a.diag.seed == b.diag.seed);
    for (int i = 0; i < a.total; ++i) {
        CHECK(a.pieces[i].cells[0] == b.pieces[i].cells[0]);
        CHECK(a.pieces[i].direction == b.pieces[i].direction);
        CHECK(a.pieces[i].type == b.pieces[i].type);
    }

    GenOptions salted = lp_test_generator::reproducible();
    salted.salt = 1;
    auto c = Generator(salted).makeLevel(3);
    CHECK(c.diag.seed != a.diag.seed);
}

TEST_CASE("Generator: cosmetic types stay within the level's palette") {
    auto g = Generator(lp_test_generator::reproducible()).makeLevel(4);
    std::set<int> types;
    for (const auto& p : g.pieces) types.insert(static_cast<int>(p.type));
    CHECK((int)types.size() <= lp::parametersForLevel(4).cosmeticTypes);
    CHECK(types.size() >= 2);
}

TEST_CASE("Generator: board too small") {
    GenOptions o = lp_test_generator::reproducible();
    o.board = lp::BoardSpec{ 40.0f, 300.0f };
    auto g = Generator(o).makeLevel(1);
    CHECK(g.diag.has(GenIssue::BoardTooSmall));
    CHECK(g.total == 0);
    CHECK(g.pieces.empty());
    CHECK(g.removalOrder.empty());
    CHECK(g.solvable);
}

TEST_CASE("Generator: explicit safe rect overrides the derived one") {
    GenOptions o = lp_test_generator::reproducible();
    o.safeRect = lp::Rect{ 100.0f, 300.0f, 200.0f, 200.0f };
    auto g = Generator(o).makeLevel(3);
    CHECK(g.safeRect.x == doctest::Approx(100.0f));
    CHECK(g.total > 0);
    for (const auto& p : g.pieces) CHECK(o.safeRect->contains(p.center().x, p.center().y));
    lp_test_generator::checkBoard(g);
}

TEST_CASE("Generator: task can be sliced step by step") {
    auto params = lp::parametersForLevel(1);
    GenOptions o = lp_test_generator::reproducible();
    o.placeBudgetPerStep = 4;

    lp::GenerationTask task(params, o);
    CHECK(task.currentStage() == lp::GenerationTask::Stage::Setup);
    CHECK_THROWS_AS(task.takeResult(), std::logic_error);

    int steps = 0;
    bool sawPlace = false, sawAssign = false;
    while (!task.step()) {
        ++steps;
        if (task.currentStage() == lp::GenerationTask::Stage::Place) sawPlace = true;
        if (task.currentStage() == lp::GenerationTask::Stage::Assign) sawAssign = true;
    }
    CHECK(task.done());
    CHECK(sawPlace);
    CHECK(sawAssign);
    CHECK(steps > 3);
    auto sliced = task.takeResult();

    o.placeBudgetPerStep = 1000;
    auto whole = Generator(o).makeOne(params);
    REQUIRE(sliced.total == whole.total);
    CHECK(sliced.removalOrder == whole.removalOrder);
    for (int i = 0; i < whole.total; ++i) CHECK(sliced.pieces[i].cells[0] == whole.pieces[i].cells[0]);
}

TEST_CASE("Generator: scoring and banding") {
    lp::GraphStats flat;
    flat.nodeCount = 10; flat.removableCount = 10; flat.removableRatio = 1.0;
    lp::DirectionStats even;
    even.maxRatio = 0.25; even.maxLocalRatio = 0.25; even.maxLaneRatio = 0.5;
    double easy = lp::difficultyScore(flat, even);

    lp::GraphStats deep = flat;
    deep.avgDepth = 6; deep.maxDepth = 12; deep.removableCount = 2; deep.removableRatio = 0.2;
    double hard = lp::difficultyScore(deep, even);
    CHECK(hard > easy);
    CHECK(hard <= 100.0);
    CHECK(easy >= 0.0);

    auto params = lp::parametersForLevel(1);
    auto v = lp::judgeDifficulty(params, flat, even, params.targetDifficulty);
    CHECK(v.distance == doctest::Approx(0.0));
    deep.hasCycle = true;
    CHECK_FALSE(lp::judgeDifficulty(params, deep, even, params.targetDifficulty).ok);
}

TEST_CASE("Generator: direction stats") {
    lp::GenerationParameters p;
    p.laneDirectionMinCount = 1;
    auto g = Generator(lp_test_generator::reproducible()).makeLevel(3);
    auto d = lp::directionStats(g.pieces, g.safeRect, p);
    int sum = d.counts[0] + d.counts[1] + d.counts[2] + d.counts[3];
    CHECK(sum == g.total);
    CHECK(d.maxRatio >= 0.25);
    CHECK(d.maxRatio <= 1.0);
    CHECK(d.maxLocalRatio >= d.maxRatio - 1e-9);
    CHECK(d.maxLaneRatio >= 0.5);
}
