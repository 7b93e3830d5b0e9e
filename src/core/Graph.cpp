// ========================= src/core/Graph.cpp =========================
#include "Graph.hpp"
#include "Detector.hpp"
#include <algorithm>
#include <functional>
#include <queue>
#include <stdexcept>

namespace lp {

    const char* solvabilityReasonName(SolvabilityReason r) {
        switch (r) {
        case SolvabilityReason::Valid: return "valid";
        case SolvabilityReason::Empty: return "empty";
        case SolvabilityReason::Cycle: return "cycle";
        case SolvabilityReason::NoTopologicalOrder: return "no_topological_order";
        case SolvabilityReason::NoInitialRemovable: return "no_initial_removable";
        }
        return "unknown";
    }

    DependencyGraph DependencyGraph::build(const Board& board) {
        DependencyGraph g;
        g.source = board;
        int maxId = -1;
        for (int i = 0; i < board.size(); ++i) maxId = std::max(maxId, board.piece(i).id);
        g.idToNode.assign(static_cast<size_t>(maxId + 1), -1);

        std::vector<int> nodeOfIndex(board.size(), -1);
        for (int i = 0; i < board.size(); ++i) {
            if (!board.isActive(i)) continue;
            const Piece& p = board.piece(i);
            if (p.id < 0) throw std::invalid_argument("DependencyGraph: piece without id");
            GraphNode n; n.id = p.id; n.pieceIndex = i;
            nodeOfIndex[i] = (int)g.nodes.size();
            g.idToNode[p.id] = (int)g.nodes.size();
            g.nodes.push_back(std::move(n));
        }

        for (auto& n : g.nodes) {
            for (int blocker : blockersOf(board, n.pieceIndex)) {
                int b = nodeOfIndex[blocker];
                if (b < 0) continue;
                n.blockedBy.push_back(b);
            }
        }
        for (int v = 0; v < g.size(); ++v) {
            auto& n = g.nodes[v];
            n.inDegree = (int)n.blockedBy.size();
            n.isRemovable = n.inDegree == 0;
            for (int b : n.blockedBy) g.nodes[b].blocking.push_back(v);
        }
        for (auto& n : g.nodes) n.outDegree = (int)n.blocking.size();
        g.computeDepths();
        return g;
    }

    int DependencyGraph::liveCount() const {
        int n = 0;
        for (const auto& x : nodes) if (!x.removed) ++n;
        return n;
    }

    int DependencyGraph::nodeOfId(int id) const {
        if (id < 0 || id >= (int)idToNode.size()) return -1;
        return idToNode[id];
    }

    // Kahn-style layering: a node's depth is fixed once all of its blockers are.
    void DependencyGraph::computeDepths() {
        std::vector<int> pending(nodes.size(), 0);
        std::queue<int> q;
        for (int v = 0; v < size(); ++v) {
            auto& n = nodes[v];
            n.depth = kInfiniteDepth;
            if (n.removed) continue;
            pending[v] = n.inDegree;
            if (pending[v] == 0) { n.depth = 0; q.push(v); }
        }
        std::vector<int> best(nodes.size(), 0);
        while (!q.empty()) {
            int v = q.front(); q.pop();
            for (int w : nodes[v].blocking) {
                best[w] = std::max(best[w], nodes[v].depth + 1);
                if (--pending[w] == 0) { nodes[w].depth = best[w]; q.push(w); }
            }
        }
    }

    std::vector<int> DependencyGraph::findCycle() const {
        enum : char { White = 0, Gray = 1, Black = 2 };
        std::vector<char> color(nodes.size(), White);
        std::vector<int> stack;
        std::vector<int> cycle;

        std::function<bool(int)> dfs = [&](int v) {
            color[v] = Gray; stack.push_back(v);
            for (int w : nodes[v].blocking) {
                if (nodes[w].removed) continue;
                if (color[w] == Gray) {
                    auto it = std::find(stack.begin(), stack.end(), w);
                    for (; it != stack.end(); ++it) cycle.push_back(nodes[*it].id);
                    return true;
                }
                if (color[w] == White && dfs(w)) return true;
            }
            stack.pop_back(); color[v] = Black;
            return false;
        };

        for (int v = 0; v < size(); ++v) {
            if (nodes[v].removed || color[v] != White) continue;
            if (dfs(v)) break;
        }
        return cycle;
    }

    std::optional<std::vector<int>> DependencyGraph::topologicalOrder() const {
        std::vector<int> indeg(nodes.size(), 0);
        std::queue<int> q;
        int live = 0;
        for (int v = 0; v < size(); ++v) {
            if (nodes[v].removed) continue;
            ++live;
            indeg[v] = nodes[v].inDegree;
            if (indeg[v] == 0) q.push(v);
        }
        std::vector<int> order;
        order.reserve(live);
        while (!q.empty()) {
            int v = q.front(); q.pop();
            order.push_back(nodes[v].id);
            for (int w : nodes[v].blocking) if (--indeg[w] == 0) q.push(w);
        }
        if ((int)order.size() != live) return std::nullopt;
        return order;
    }

    std::vector<int> DependencyGraph::removableNodes() const {
        std::vector<int> out;
        for (const auto& n : nodes) if (!n.removed && n.isRemovable) out.push_back(n.id);
        return out;
    }

    std::vector<int> DependencyGraph::safeMoves() const {
        auto removable = removableNodes();
        if (removable.empty()) return {};
        if (liveCount() > kSafeMoveNodeCap) {
            // removal only deletes edges, so on large boards the acyclicity of the current graph decides
            return hasCycle() ? std::vector<int>{} : removable;
        }
        std::vector<int> safe;
        for (int id : removable) {
            Board sim = source;
            sim.setRemoved(nodes[nodeOfId(id)].pieceIndex);
            auto g = DependencyGraph::build(sim);
            if (!g.hasCycle() && g.topologicalOrder()) safe.push_back(id);
        }
        return safe;
    }

    double DependencyGraph::toleranceRate() const {
        auto removable = removableNodes();
        if (removable.empty()) return 0.0;
        return double(safeMoves().size()) / removable.size();
    }

    std::optional<int> DependencyGraph::hint() const {
        auto safe = safeMoves();
        const auto& pool = safe.empty() ? removableNodes() : safe;
        std::optional<int> best;
        int bestUnlocks = -1;
        for (int id : pool) {
            // the move that frees the most pieces; ties keep the lowest id
            int unlocks = 0;
            for (int w : nodes[nodeOfId(id)].blocking)
                if (!nodes[w].removed && nodes[w].inDegree == 1) ++unlocks;
            if (unlocks > bestUnlocks) { best = id; bestUnlocks = unlocks; }
        }
        return best;
    }

    std::vector<int> DependencyGraph::solutionPath() const {
        auto order = topologicalOrder();
        return order ? *order : std::vector<int>{};
    }

    SolvabilityReport DependencyGraph::validateSolvability() const {
        SolvabilityReport r;
        if (liveCount() == 0) { r.solvable = true; r.reason = SolvabilityReason::Empty; return r; }
        r.cycle = findCycle();
        if (!r.cycle.empty()) { r.reason = SolvabilityReason::Cycle; return r; }
        if (!topologicalOrder()) { r.reason = SolvabilityReason::NoTopologicalOrder; return r; }
        if (removableNodes().empty()) { r.reason = SolvabilityReason::NoInitialRemovable; return r; }
        r.solvable = true; r.reason = SolvabilityReason::Valid;
        return r;
    }

    GraphStats DependencyGraph::stats() const {
        GraphStats s;
        long long depthSum = 0; int finite = 0;
        for (const auto& n : nodes) {
            if (n.removed) continue;
            ++s.nodeCount;
            if (n.isRemovable) ++s.removableCount;
            if (n.depth == kInfiniteDepth) continue;
            depthSum += n.depth; ++finite;
            s.maxDepth = std::max(s.maxDepth, n.depth);
        }
        s.avgDepth = finite > 0 ? double(depthSum) / finite : 0.0;
        s.removableRatio = s.nodeCount > 0 ? double(s.removableCount) / s.nodeCount : 0.0;
        s.hasCycle = finite < s.nodeCount;
        return s;
    }

    double DependencyGraph::avgBranchFactor() const {
        int blockers = 0, edges = 0;
        for (const auto& n : nodes) {
            if (n.removed || n.outDegree == 0) continue;
            ++blockers; edges += n.outDegree;
        }
        return blockers > 0 ? double(edges) / blockers : 0.0;
    }

    std::vector<int> DependencyGraph::depthDistribution() const {
        std::vector<int> dist;
        for (const auto& n : nodes) {
            if (n.removed || n.depth == kInfiniteDepth) continue;
            if ((int)dist.size() <= n.depth) dist.resize(n.depth + 1, 0);
            ++dist[n.depth];
        }
        return dist;
    }

    double DependencyGraph::difficulty() const {
        auto s = stats();
        if (s.hasCycle) return 100.0;
        double score = std::min(40.0, s.maxDepth * 4.0)
            + std::min(25.0, s.avgDepth * 5.0)
            + std::min(20.0, (1.0 - s.removableRatio) * 20.0)
            + std::min(15.0, avgBranchFactor() * 5.0);
        return std::clamp(score, 0.0, 100.0);
    }

    void DependencyGraph::updateAfterRemoval(int id) {
        int v = nodeOfId(id);
        if (v < 0) throw std::out_of_range("updateAfterRemoval: unknown piece id");
        auto& n = nodes[v];
        if (n.removed) return;
        n.removed = true;
        n.isRemovable = false;

        for (int w : n.blocking) {
            auto& m = nodes[w];
            m.blockedBy.erase(std::remove(m.blockedBy.begin(), m.blockedBy.end(), v), m.blockedBy.end());
            m.inDegree = (int)m.blockedBy.size();
            if (m.inDegree == 0) m.isRemovable = true;
        }
        // a forced removal may still have blockers
        for (int b : n.blockedBy) {
            auto& m = nodes[b];
            m.blocking.erase(std::remove(m.blocking.begin(), m.blocking.end(), v), m.blocking.end());
            m.outDegree = (int)m.blocking.size();
        }
        n.blocking.clear(); n.blockedBy.clear();
        n.inDegree = 0; n.outDegree = 0;

        source.setRemoved(n.pieceIndex);
        computeDepths();
    }

} // namespace lp
