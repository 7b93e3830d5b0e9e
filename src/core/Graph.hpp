// ========================= src/core/Graph.hpp =========================
#pragma once
#include "Board.hpp"
#include <optional>

namespace lp {

    constexpr int kSafeMoveNodeCap = 50;  // simulated-removal analysis only runs up to this many nodes

    // Edge blocker -> blocked. blocking/blockedBy hold node indices and are kept mutual inverses.
    struct GraphNode {
        int id{ -1 };                // Piece::id
        int pieceIndex{ -1 };        // index into the board the graph was built from
        std::vector<int> blockedBy;
        std::vector<int> blocking;
        int inDegree{ 0 };
        int outDegree{ 0 };
        int depth{ 0 };              // kInfiniteDepth inside or behind a cycle
        bool isRemovable{ false };
        bool removed{ false };
    };

    struct GraphStats {
        int nodeCount{ 0 };
        int maxDepth{ 0 };           // over finite depths
        double avgDepth{ 0 };        // over finite depths
        int removableCount{ 0 };
        double removableRatio{ 0 };
        bool hasCycle{ false };
    };

    enum class SolvabilityReason : uint8_t { Valid = 0, Empty, Cycle, NoTopologicalOrder, NoInitialRemovable };
    const char* solvabilityReasonName(SolvabilityReason r);

    struct SolvabilityReport {
        bool solvable{ false };
        SolvabilityReason reason{ SolvabilityReason::Empty };
        std::vector<int> cycle;      // piece ids on the detected cycle
    };

    class DependencyGraph {
    public:
        // Nodes are the board's active pieces.
        static DependencyGraph build(const Board& board);

        int size() const { return static_cast<int>(nodes.size()); }
        int liveCount() const;
        const GraphNode& node(int n) const { return nodes.at(n); }
        int nodeOfId(int id) const;
        const Board& board() const { return source; }

        bool hasCycle() const { return !findCycle().empty(); }
        std::vector<int> findCycle() const;                       // ids, empty when acyclic
        std::optional<std::vector<int>> topologicalOrder() const; // ids, nullopt on a cycle

        std::vector<int> removableNodes() const;                  // ids
        std::vector<int> safeMoves() const;                       // ids
        double toleranceRate() const;                             // safe / removable, 0 when nothing is removable
        std::optional<int> hint() const;                          // safe move that frees the most pieces
        std::vector<int> solutionPath() const;                    // ids, empty when unsolvable
        SolvabilityReport validateSolvability() const;

        GraphStats stats() const;
        double avgBranchFactor() const;                           // mean out-degree of blocking nodes
        std::vector<int> depthDistribution() const;               // count per finite depth
        double difficulty() const;                                // 0..100, graph features only

        // Marks the piece removed and releases everything it blocked. Depths are recomputed.
        void updateAfterRemoval(int id);

    private:
        std::vector<GraphNode> nodes;
        std::vector<int> idToNode;   // Piece::id -> node index, -1 if absent
        Board source;

        void computeDepths();
    };

} // namespace lp
