// ========================= src/core/Difficulty.hpp =========================
#pragma once
#include "Types.hpp"

namespace lp {

    enum class LayoutProfileKind : uint8_t { Uniform = 0, Ring = 1, DiagonalBand = 2, TwinLumps = 3, HollowCenter = 4 };
    const char* layoutProfileName(LayoutProfileKind k);

    enum class Phase : uint8_t { Tutorial = 0, Ramp = 1, Growth = 2, Challenge = 3, Master = 4, Legendary = 5 };
    const char* phaseName(Phase p);

    // Immutable per-level generation config. Defaults are the level-3 curve start.
    struct GenerationParameters {
        int level{ 3 };
        Phase phase{ Phase::Growth };
        bool isReliefLevel{ false };

        int pieceCountMin{ 100 };
        int pieceCountMax{ 120 };
        float shortSide{ 16.0f };
        int cosmeticTypes{ 4 };          // 1..5
        double depthFactor{ 0.9 };       // weight of the center-distance bias in the peel

        double targetFillRate{ 0.83 };
        bool forceFillRate{ false };     // ignore pieceCountMax, fill to targetFillRate

        std::array<double, kDirectionCount> directionMix{ {0.25, 0.25, 0.25, 0.25} }; // up, right, down, left

        double depthTargetMin{ 3.8 };
        double depthTargetMax{ 6.2 };
        double removableRatioMin{ 0.15 };
        double removableRatioMax{ 0.25 };

        double maxDirectionRatio{ 0.7 };
        double maxLocalDirectionRatio{ 0.6 };
        double maxLaneDirectionRatio{ 0.65 };
        int localDirectionGrid{ 4 };     // N x N sectors over the safe rect
        double localDirectionWeight{ 0.5 };
        double laneDirectionWeight{ 0.5 };
        int laneDirectionMinCount{ 3 };  // lanes with fewer pieces do not count toward the lane ratio
        double axisBalanceWeight{ 0.35 };

        std::vector<LayoutProfileKind> layoutProfiles{ LayoutProfileKind::Uniform };

        double targetDifficulty{ 82.0 };
        double difficultyTolerance{ 6.0 };

        int maxAttempts{ 6 };
        int maxTimeMs{ 2500 };
    };

    Phase phaseForLevel(int level);
    bool isReliefLevel(int level);

    // Pure level index -> parameters. Throws std::invalid_argument for level < 1.
    GenerationParameters parametersForLevel(int level);

} // namespace lp
