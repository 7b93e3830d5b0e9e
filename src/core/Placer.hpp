// ========================= src/core/Placer.hpp =========================
#pragma once
#include "Lattice.hpp"
#include "Difficulty.hpp"
#include "Random.hpp"

namespace lp {

    // Spatial weighting used to order cells before pairing.
    struct LayoutProfile {
        LayoutProfileKind kind{ LayoutProfileKind::Uniform };
        Vec2 center;
        float maxR{ 1 };
        float rotation{ 0 };
        float ringBand{ 0.65f };
        float ringSigma{ 0.12f };
        float bandWidth{ 1 };
        float lumpOffset{ 0 };

        double weight(Vec2 p) const;
    };

    LayoutProfile makeLayoutProfile(const GenerationParameters& params, const Lattice& lattice, RNG& rng);

    // Pieces the placer aims for on this lattice.
    int placementTarget(const GenerationParameters& params, const Lattice& lattice);

    // Greedy dual-cell packer. Pass 1 walks cells by descending weight; pass 2 walks the
    // remaining cells shuffled. Each step() handles up to `budget` cells so it can be sliced.
    class LayoutPlacer {
    public:
        LayoutPlacer(Lattice& lattice, const LayoutProfile& profile, const GenerationParameters& params, int targetCount, RNG& rng);

        bool step(int budget = 32);  // true once placement is finished
        bool done() const { return pass > 1; }

        int target() const { return targetCount; }
        bool shortfall() const { return done() && (int)placed.size() < targetCount; }
        const std::vector<Piece>& pieces() const { return placed; }
        std::vector<Piece> takePieces() { return std::move(placed); }

    private:
        Lattice& lattice; const GenerationParameters& params; RNG& rng;
        int targetCount{ 0 };
        int pass{ 0 }; size_t cursor{ 0 };
        std::vector<CellCoord> order;
        std::vector<double> weights;       // indexed like lattice cells, by position in lattice.cells()
        std::vector<int> cellSlot;         // (row,col) -> index into weights
        std::array<int, 2> axisCounts{ {0, 0} };
        std::vector<Piece> placed;

        int slotOf(int row, int col) const;
        void tryPlaceFrom(const CellCoord& c);
        void beginMopUp();
    };

    // Runs a placer to completion.
    std::vector<Piece> placeLayout(Lattice& lattice, const LayoutProfile& profile, const GenerationParameters& params, int targetCount, RNG& rng);

} // namespace lp
