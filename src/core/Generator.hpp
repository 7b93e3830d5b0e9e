// ========================= src/core/Generator.hpp =========================
#pragma once
#include "Placer.hpp"
#include "Assigner.hpp"
#include "Graph.hpp"
#include <chrono>
#include <memory>
#include <optional>

namespace lp {

    enum class GenIssue : uint8_t {
        BoardTooSmall = 1 << 0,       // lattice has fewer than 2 usable cells
        PlacementShortfall = 1 << 1,  // placer under-filled its target
        AssignmentDeadend = 1 << 2,   // at least one peel attempt got stuck
        DifficultyOutOfBand = 1 << 3, // returned board is the best out-of-band candidate
    };

    struct DirectionStats {
        std::array<int, kDirectionCount> counts{ {0,0,0,0} };
        double maxRatio{ 0 };         // global
        double maxLocalRatio{ 0 };    // worst sector
        double maxLaneRatio{ 0 };     // worst axis, over lanes holding enough pieces
    };

    struct GenerationDiagnostics {
        double avgDepth{ 0 };
        int maxDepth{ 0 };
        int removableCount{ 0 };
        double removableRatio{ 0 };
        double fillRate{ 0 };
        int latticeCells{ 0 };
        int placementTarget{ 0 };
        DirectionStats directions;
        std::string layoutProfile;
        uint32_t seed{ 0 };           // seed of the attempt that produced the board
        int attempts{ 0 };
        int deadends{ 0 };
        int droppedPieces{ 0 };
        bool withinBand{ false };
        double elapsedMs{ 0 };
        uint8_t issues{ 0 };

        bool has(GenIssue i) const { return (issues & static_cast<uint8_t>(i)) != 0; }
        void flag(GenIssue i) { issues |= static_cast<uint8_t>(i); }
    };

    struct GenerationResult {
        int level{ 0 };
        std::vector<Piece> pieces;        // ordered by id
        std::vector<int> removalOrder;    // ids; a valid clearing sequence
        int total{ 0 };
        bool solvable{ false };
        double difficultyScore{ 0 };
        std::string difficultyLabel;
        GenerationDiagnostics diag;
        BoardSpec screen;
        Rect boardRect;
        Rect safeRect;
    };

    struct GenOptions {
        BoardSpec board;
        uint32_t salt{ 0 };               // varies the seed without changing the level
        std::optional<Rect> safeRect;     // overrides the rect derived from `board`
        bool honorTimeBudget{ true };     // false = attempt budget only, fully reproducible
        int placeBudgetPerStep{ 32 };     // cells handled per placer step
    };

    DirectionStats directionStats(const std::vector<Piece>& pieces, const Rect& safeRect, const GenerationParameters& params);
    double difficultyScore(const GraphStats& g, const DirectionStats& d);

    struct Verdict { bool ok{ false }; double distance{ 0 }; };
    Verdict judgeDifficulty(const GenerationParameters& params, const GraphStats& g, const DirectionStats& d, double score);

    // Resumable generation: each step() does a small bounded unit of work (a batch of placement
    // cells, one peel commit, or one validation), so callers can slice it across frames.
    class GenerationTask {
    public:
        enum class Stage : uint8_t { Setup, Place, Assign, Validate, Finished };

        GenerationTask(GenerationParameters params, GenOptions opt);
        GenerationTask(const GenerationTask&) = delete;
        GenerationTask& operator=(const GenerationTask&) = delete;
        ~GenerationTask();

        bool step();                       // true once finished
        bool done() const { return stage == Stage::Finished; }
        Stage currentStage() const { return stage; }
        int attemptIndex() const { return attemptNo; }

        GenerationResult run();            // steps to completion, then takes the result
        GenerationResult takeResult();     // valid once done()

    private:
        struct Attempt;
        GenerationParameters params; GenOptions opt;
        Stage stage{ Stage::Setup };
        std::unique_ptr<Attempt> current;
        std::optional<GenerationResult> best; double bestDistance{ 0 };
        GenerationResult out;
        uint32_t baseSeed{ 0 };
        int attemptNo{ 0 }; int attemptsRun{ 0 }; bool fallbackRan{ false };
        int deadends{ 0 }; bool shortfallSeen{ false };
        Rect boardRect, safeRect;
        std::chrono::steady_clock::time_point t0;

        void setup();
        void startAttempt(bool fallback);
        void placeStep();
        void assignStep();
        void validate();
        void nextAttempt();
        void finish(GenerationResult r, bool outOfBand);
        bool timeUp() const;
    };

    class Generator {
    public:
        explicit Generator(GenOptions opt = {}) :opt(opt) {}

        GenerationResult makeLevel(int level) const;
        GenerationResult makeOne(const GenerationParameters& params) const;

    private:
        GenOptions opt;
    };

} // namespace lp
