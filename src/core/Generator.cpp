// ========================= src/core/Generator.cpp =========================
#include "Generator.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <map>
#include <stdexcept>

namespace lp {

    struct GenerationTask::Attempt {
        uint32_t seed{ 0 };
        bool fallback{ false };
        RNG rng;
        Lattice lattice;
        LayoutProfile profile;
        std::unique_ptr<LayoutPlacer> placer;
        std::vector<Piece> pieces;
        std::unique_ptr<PeelAssigner> peel;
    };

    DirectionStats directionStats(const std::vector<Piece>& pieces, const Rect& safe, const GenerationParameters& params) {
        DirectionStats d;
        for (const auto& p : pieces) ++d.counts[dirIndex(p.direction)];
        int total = static_cast<int>(pieces.size());
        if (total > 0) d.maxRatio = double(*std::max_element(d.counts.begin(), d.counts.end())) / total;

        int grid = params.localDirectionGrid;
        if (grid <= 1 || safe.width <= 0 || safe.height <= 0) {
            d.maxLocalRatio = 0.25;
        }
        else {
            std::vector<std::array<int, kDirectionCount + 1>> sectors(static_cast<size_t>(grid) * grid);
            for (auto& s : sectors) s.fill(0);
            for (const auto& p : pieces) {
                Vec2 c = p.center();
                int sx = std::clamp(static_cast<int>((c.x - safe.x) / safe.width * grid), 0, grid - 1);
                int sy = std::clamp(static_cast<int>((c.y - safe.y) / safe.height * grid), 0, grid - 1);
                auto& s = sectors[sy * grid + sx];
                ++s[dirIndex(p.direction)]; ++s[kDirectionCount];
            }
            for (const auto& s : sectors) {
                if (!s[kDirectionCount]) continue;
                int top = *std::max_element(s.begin(), s.begin() + kDirectionCount);
                d.maxLocalRatio = std::max(d.maxLocalRatio, double(top) / s[kDirectionCount]);
            }
        }

        // lane majority direction, then how lanes of one axis split between its two directions
        std::map<std::pair<int, int>, std::array<int, kDirectionCount>> lanes;
        for (const auto& p : pieces) {
            if (!p.hasLattice) continue;
            LaneKey k = laneOf(p);
            auto& l = lanes[{ static_cast<int>(k.axis), k.index }];
            ++l[dirIndex(p.direction)];
        }
        std::array<std::array<int, kDirectionCount>, 2> perAxis{};
        for (const auto& kv : lanes) {
            const auto& l = kv.second;
            int n = l[0] + l[1] + l[2] + l[3];
            if (n < params.laneDirectionMinCount) continue;
            int major = static_cast<int>(std::max_element(l.begin(), l.end()) - l.begin());
            ++perAxis[kv.first.first][major];
        }
        d.maxLaneRatio = 0.5;
        bool any = false;
        for (const auto& a : perAxis) {
            int n = a[0] + a[1] + a[2] + a[3];
            if (!n) continue;
            double r = double(*std::max_element(a.begin(), a.end())) / n;
            d.maxLaneRatio = any ? std::max(d.maxLaneRatio, r) : r;
            any = true;
        }
        return d;
    }

    static double diversityOf(double maxRatio) { return std::clamp(1.0 - (maxRatio - 0.25) / 0.75, 0.0, 1.0); }

    double difficultyScore(const GraphStats& g, const DirectionStats& d) {
        double avgNorm = std::min(1.0, g.avgDepth / 8.0);
        double maxNorm = std::min(1.0, g.maxDepth / 16.0);
        double removablePenalty = std::clamp(1.0 - g.removableRatio, 0.0, 1.0);
        double score = 100.0 * (0.36 * avgNorm + 0.27 * maxNorm + 0.2 * removablePenalty
            + 0.07 * diversityOf(d.maxRatio) + 0.05 * diversityOf(d.maxLocalRatio) + 0.05 * diversityOf(d.maxLaneRatio));
        return std::round(score * 10.0) / 10.0;
    }

    Verdict judgeDifficulty(const GenerationParameters& p, const GraphStats& g, const DirectionStats& d, double score) {
        Verdict v;
        double lo = std::max(0.0, p.targetDifficulty - p.difficultyTolerance), hi = p.targetDifficulty + p.difficultyTolerance;
        bool directionOk = d.maxRatio <= p.maxDirectionRatio;
        bool localOk = d.maxLocalRatio <= p.maxLocalDirectionRatio;
        bool laneOk = d.maxLaneRatio <= p.maxLaneDirectionRatio;
        bool depthOk = g.avgDepth >= p.depthTargetMin && g.avgDepth <= p.depthTargetMax;
        bool removableOk = g.removableRatio >= p.removableRatioMin && g.removableRatio <= p.removableRatioMax;
        bool scoreOk = p.targetDifficulty <= 0 || (score >= lo && score <= hi);
        v.ok = !g.hasCycle && directionOk && localOk && laneOk && depthOk && removableOk && scoreOk;
        v.distance = std::fabs(score - p.targetDifficulty);
        return v;
    }

    // cosmetic types dealt round-robin over depth layers, each layer shuffled
    static void assignCosmeticTypes(std::vector<Piece>& pieces, int typeCount, RNG& rng) {
        std::vector<CosmeticType> pool;
        for (int t = 0; t < kCosmeticTypeCount; ++t) pool.push_back(static_cast<CosmeticType>(t));
        rng.shuffle(pool);
        pool.resize(static_cast<size_t>(std::clamp(typeCount, 1, kCosmeticTypeCount)));

        std::map<int, std::vector<int>> layers;
        for (size_t i = 0; i < pieces.size(); ++i) layers[pieces[i].depth].push_back((int)i);
        size_t next = 0;
        for (auto& kv : layers) {
            rng.shuffle(kv.second);
            for (int i : kv.second) pieces[i].type = pool[next++ % pool.size()];
        }
    }

    GenerationTask::GenerationTask(GenerationParameters p, GenOptions o) :params(std::move(p)), opt(std::move(o)) {
        if (opt.board.width < 0 || opt.board.height < 0) throw std::invalid_argument("GenerationTask: negative board size");
    }

    GenerationTask::~GenerationTask() = default;

    bool GenerationTask::timeUp() const {
        if (!opt.honorTimeBudget) return false;
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0).count();
        return ms >= params.maxTimeMs;
    }

    void GenerationTask::setup() {
        t0 = std::chrono::steady_clock::now();
        baseSeed = levelSeed(params.level, opt.salt);
        boardRect = makeBoardRect(opt.board);
        safeRect = opt.safeRect ? *opt.safeRect : makeSafeRect(boardRect, params.shortSide);

        Lattice sizing(safeRect, params.shortSide);
        if (sizing.cellCount() < 2) {
            spdlog::warn("level {}: board too small ({} usable cells)", params.level, sizing.cellCount());
            GenerationResult r;
            r.diag.latticeCells = sizing.cellCount();
            r.diag.flag(GenIssue::BoardTooSmall);
            r.solvable = true;  // nothing to clear
            finish(std::move(r), false);
            return;
        }
        startAttempt(false);
    }

    void GenerationTask::startAttempt(bool fallback) {
        current = std::make_unique<Attempt>();
        ++attemptsRun;
        Attempt& a = *current;
        a.fallback = fallback;
        a.seed = attemptSeed(baseSeed, attemptNo);
        a.rng = RNG(a.seed);
        a.lattice = Lattice(safeRect, params.shortSide);
        a.profile = makeLayoutProfile(params, a.lattice, a.rng);
        a.placer = std::make_unique<LayoutPlacer>(a.lattice, a.profile, params, placementTarget(params, a.lattice), a.rng);
        stage = Stage::Place;
        spdlog::debug("level {}: attempt {} seed {} profile {}{}", params.level, attemptNo, a.seed,
                      layoutProfileName(a.profile.kind), fallback ? " (lenient)" : "");
    }

    void GenerationTask::placeStep() {
        Attempt& a = *current;
        if (!a.placer->step(opt.placeBudgetPerStep)) return;
        int placed = static_cast<int>(a.placer->pieces().size());
        // fill-rate levels may legitimately land under the count floor
        bool underFloor = !params.forceFillRate && placed < params.pieceCountMin;
        if (a.placer->shortfall() || underFloor) {
            shortfallSeen = true;
            spdlog::debug("level {}: placed {} of {} pieces (floor {})", params.level, placed, a.placer->target(),
                          params.pieceCountMin);
        }
        a.pieces = a.placer->takePieces();
        a.placer.reset();
        if (a.pieces.empty()) { nextAttempt(); return; }
        a.peel = std::make_unique<PeelAssigner>(a.lattice, a.pieces, params, a.rng, a.fallback);
        stage = Stage::Assign;
    }

    void GenerationTask::assignStep() {
        Attempt& a = *current;
        if (!a.peel->step()) return;
        if (a.peel->deadEnd()) {
            ++deadends;
            spdlog::debug("level {}: attempt {} dead-ended with {} of {} pieces committed", params.level, attemptNo,
                          a.peel->order().size(), a.pieces.size());
            nextAttempt();
            return;
        }
        stage = Stage::Validate;
    }

    void GenerationTask::validate() {
        Attempt& a = *current;

        // drop pieces the lenient peel gave up on and renumber ids densely
        std::vector<int> remap(a.pieces.size(), -1);
        for (int id : a.peel->dropped()) remap[id] = -2;
        std::vector<Piece> kept;
        for (auto& p : a.pieces) {
            if (remap[p.id] == -2) continue;
            remap[p.id] = (int)kept.size();
            p.id = (int)kept.size();
            kept.push_back(p);
        }

        GenerationResult r;
        r.level = params.level;
        r.screen = opt.board;
        r.boardRect = boardRect;
        r.safeRect = safeRect;
        for (int id : a.peel->order()) r.removalOrder.push_back(remap[id]);

        Board board(kept, opt.board);
        auto graph = DependencyGraph::build(board);
        auto gs = graph.stats();
        for (int v = 0; v < graph.size(); ++v) kept[graph.node(v).pieceIndex].depth = graph.node(v).depth;
        assignCosmeticTypes(kept, params.cosmeticTypes, a.rng);

        auto ds = directionStats(kept, safeRect, params);
        double score = difficultyScore(gs, ds);
        auto verdict = judgeDifficulty(params, gs, ds, score);

        r.solvable = graph.validateSolvability().solvable;
        r.difficultyScore = score;
        r.difficultyLabel = labelForScore(score);
        r.total = static_cast<int>(kept.size());
        r.pieces = std::move(kept);

        auto& dg = r.diag;
        dg.avgDepth = gs.avgDepth; dg.maxDepth = gs.maxDepth;
        dg.removableCount = gs.removableCount; dg.removableRatio = gs.removableRatio;
        dg.latticeCells = a.lattice.cellCount();
        dg.fillRate = dg.latticeCells > 0 ? 2.0 * r.total / dg.latticeCells : 0.0;
        dg.placementTarget = placementTarget(params, a.lattice);
        dg.directions = ds;
        dg.layoutProfile = layoutProfileName(a.profile.kind);
        dg.seed = a.seed;
        dg.droppedPieces = static_cast<int>(a.peel->dropped().size());
        dg.withinBand = verdict.ok;

        spdlog::debug("level {}: attempt {} score {:.1f} avgDepth {:.2f} removable {:.2f} ok={}", params.level, attemptNo,
                      score, gs.avgDepth, gs.removableRatio, verdict.ok);

        if (verdict.ok && r.solvable) { finish(std::move(r), false); return; }
        if (a.fallback) { finish(std::move(r), true); return; }
        if (r.solvable && (!best || verdict.distance < bestDistance)) {
            bestDistance = verdict.distance;
            best = std::move(r);
        }
        nextAttempt();
    }

    void GenerationTask::nextAttempt() {
        current.reset();
        if (fallbackRan) {
            // the lenient pass always produces a board, so this only happens on a degenerate lattice
            spdlog::warn("level {}: lenient pass produced no pieces", params.level);
            GenerationResult r; r.level = params.level; r.solvable = true;
            finish(std::move(r), false);
            return;
        }
        ++attemptNo;
        if (attemptNo < params.maxAttempts && !timeUp()) { startAttempt(false); return; }
        if (best) {
            GenerationResult r = std::move(*best);
            best.reset();
            finish(std::move(r), true);
            return;
        }
        spdlog::warn("level {}: all {} attempts dead-ended, running lenient pass", params.level, attemptNo);
        fallbackRan = true;
        startAttempt(true);
    }

    void GenerationTask::finish(GenerationResult r, bool outOfBand) {
        auto& dg = r.diag;
        dg.attempts = attemptsRun;
        dg.deadends = deadends;
        if (deadends > 0) dg.flag(GenIssue::AssignmentDeadend);
        if (shortfallSeen) dg.flag(GenIssue::PlacementShortfall);
        if (outOfBand) {
            dg.flag(GenIssue::DifficultyOutOfBand);
            spdlog::warn("level {}: no attempt within band, using best (score {:.1f}, target {:.1f})",
                         params.level, r.difficultyScore, params.targetDifficulty);
        }
        dg.elapsedMs = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t0).count();
        r.level = params.level;
        r.screen = opt.board;
        r.boardRect = boardRect;
        r.safeRect = safeRect;
        spdlog::info("level {} generated: {} pieces, score {:.1f} ({}), attempts {}, {:.1f} ms",
                     r.level, r.total, r.difficultyScore, r.difficultyLabel, dg.attempts, dg.elapsedMs);
        out = std::move(r);
        stage = Stage::Finished;
    }

    bool GenerationTask::step() {
        switch (stage) {
        case Stage::Setup: setup(); break;
        case Stage::Place: placeStep(); break;
        case Stage::Assign: assignStep(); break;
        case Stage::Validate: validate(); break;
        case Stage::Finished: break;
        }
        return done();
    }

    GenerationResult GenerationTask::run() {
        while (!step()) {}
        return takeResult();
    }

    GenerationResult GenerationTask::takeResult() {
        if (!done()) throw std::logic_error("GenerationTask: result taken before completion");
        return std::move(out);
    }

    GenerationResult Generator::makeLevel(int level) const {
        return makeOne(parametersForLevel(level));
    }

    GenerationResult Generator::makeOne(const GenerationParameters& params) const {
        GenerationTask task(params, opt);
        return task.run();
    }

} // namespace lp
