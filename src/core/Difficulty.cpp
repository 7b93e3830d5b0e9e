// ========================= src/core/Difficulty.cpp =========================
#include "Difficulty.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace lp {

    const char* layoutProfileName(LayoutProfileKind k) {
        switch (k) {
        case LayoutProfileKind::Uniform: return "uniform";
        case LayoutProfileKind::Ring: return "ring";
        case LayoutProfileKind::DiagonalBand: return "diagonalBand";
        case LayoutProfileKind::TwinLumps: return "twinLumps";
        case LayoutProfileKind::HollowCenter: return "hollowCenter";
        }
        return "uniform";
    }

    const char* phaseName(Phase p) {
        static const char* names[6] = { "Tutorial", "Ramp", "Growth", "Challenge", "Master", "Legendary" };
        return names[static_cast<int>(p)];
    }

    Phase phaseForLevel(int level) {
        if (level <= 1) return Phase::Tutorial;
        if (level == 2) return Phase::Ramp;
        if (level <= 10) return Phase::Growth;
        if (level <= 30) return Phase::Challenge;
        if (level <= 60) return Phase::Master;
        return Phase::Legendary;
    }

    // every fifth level of the cycle eases off slightly
    bool isReliefLevel(int level) { return level >= 3 && (level - 1) % 5 == 4; }

    static GenerationParameters tutorialLevel() {
        GenerationParameters g;
        g.level = 1; g.phase = Phase::Tutorial;
        g.pieceCountMin = 4; g.pieceCountMax = 6;
        g.shortSide = 28.0f; g.cosmeticTypes = 3; g.depthFactor = 0.05;
        g.targetFillRate = 0.7; g.forceFillRate = false;
        g.directionMix = { {0.3, 0.25, 0.25, 0.2} };
        g.depthTargetMin = 0.0; g.depthTargetMax = 1.8;
        g.removableRatioMin = 0.6; g.removableRatioMax = 1.0;
        // a handful of pieces cannot balance sectors or lanes
        g.maxDirectionRatio = 0.9; g.maxLocalDirectionRatio = 1.0; g.maxLaneDirectionRatio = 1.0;
        g.localDirectionGrid = 2; g.localDirectionWeight = 0.1; g.laneDirectionWeight = 0.15;
        g.laneDirectionMinCount = 2; g.axisBalanceWeight = 0.2;
        g.layoutProfiles = { LayoutProfileKind::Uniform, LayoutProfileKind::HollowCenter };
        g.targetDifficulty = 10; g.difficultyTolerance = 4;
        g.maxAttempts = 3; g.maxTimeMs = 1000;
        return g;
    }

    static GenerationParameters rampLevel() {
        GenerationParameters g;
        g.level = 2; g.phase = Phase::Ramp;
        g.pieceCountMin = 100; g.pieceCountMax = 120;
        g.shortSide = 16.0f; g.cosmeticTypes = 4; g.depthFactor = 0.9;
        g.targetFillRate = 0.85; g.forceFillRate = true;
        g.depthTargetMin = 4.5; g.depthTargetMax = 7.5;
        g.removableRatioMin = 0.08; g.removableRatioMax = 0.22;
        g.maxDirectionRatio = 0.7; g.maxLocalDirectionRatio = 0.65; g.maxLaneDirectionRatio = 0.7;
        g.localDirectionGrid = 3; g.localDirectionWeight = 0.35; g.laneDirectionWeight = 0.45;
        g.laneDirectionMinCount = 3; g.axisBalanceWeight = 0.35;
        g.layoutProfiles = { LayoutProfileKind::Ring, LayoutProfileKind::DiagonalBand,
                             LayoutProfileKind::TwinLumps, LayoutProfileKind::HollowCenter };
        g.targetDifficulty = 80; g.difficultyTolerance = 8;
        g.maxAttempts = 3; g.maxTimeMs = 2000;
        return g;
    }

    GenerationParameters parametersForLevel(int level) {
        if (level < 1) throw std::invalid_argument("parametersForLevel: level must be >= 1");
        if (level == 1) return tutorialLevel();
        if (level == 2) return rampLevel();

        // reaches the top of the curve at level 53
        double progress = std::min(1.0, (level - 3) / 50.0);
        int cycle = (level - 1) % 5;
        bool relief = cycle == 4;
        int countAdjust = relief ? -10 : cycle * 3;
        double depthAdjust = relief ? -0.05 : cycle * 0.01;

        GenerationParameters g;
        g.level = level;
        g.phase = phaseForLevel(level);
        g.isReliefLevel = relief;
        g.pieceCountMax = std::clamp(static_cast<int>(std::lround(120 + progress * 70)) + countAdjust, 120, 200);
        g.pieceCountMin = g.pieceCountMax - 20;
        g.shortSide = 16.0f;
        g.cosmeticTypes = level < 10 ? 4 : 5;
        g.depthFactor = std::clamp(0.9 + progress * 0.05 + depthAdjust, 0.85, 0.95);
        g.targetFillRate = std::min(0.9, 0.83 + progress * 0.05);
        g.forceFillRate = false;

        double avgDepth = 5.0 + progress * 2.6;
        g.depthTargetMin = avgDepth - 1.2;
        g.depthTargetMax = avgDepth + 1.2;
        double removableBase = std::max(0.1, 0.2 - progress * 0.08);
        g.removableRatioMin = std::max(0.06, removableBase - 0.05);
        g.removableRatioMax = std::min(0.28, removableBase + 0.05);

        g.maxDirectionRatio = 0.7; g.maxLocalDirectionRatio = 0.6; g.maxLaneDirectionRatio = 0.65;
        g.localDirectionGrid = 4; g.localDirectionWeight = 0.5; g.laneDirectionWeight = 0.5;
        g.laneDirectionMinCount = 3; g.axisBalanceWeight = 0.35;
        g.layoutProfiles = { LayoutProfileKind::Ring, LayoutProfileKind::DiagonalBand, LayoutProfileKind::TwinLumps,
                             LayoutProfileKind::HollowCenter, LayoutProfileKind::Uniform };

        g.targetDifficulty = std::min(100.0, 80 + (level - 2) * 2.0);
        g.difficultyTolerance = 6;
        g.maxAttempts = 6; g.maxTimeMs = 2500;
        return g;
    }

} // namespace lp
