// ========================= src/io/Csv.cpp =========================
#include "Csv.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <sstream>
#include <filesystem>
#include <stdexcept>
#include <algorithm>

namespace lp {

    static const char* kHeader = "index,level,seed,shortSide,pieces,score,label,avgDepth,maxDepth,removableRatio,fillRate,blocks";

    static std::string encodeBlocks(const std::vector<Piece>& pieces) {
        std::ostringstream oss;
        for (size_t i = 0; i < pieces.size(); ++i) {
            const auto& p = pieces[i];
            oss << p.cells[0].row << '_' << p.cells[0].col << '_' << (p.axis == Axis::Row ? 'r' : 'c') << '_'
                << dirIndex(p.direction) << '_' << static_cast<int>(p.type);
            if (i + 1 < pieces.size()) oss << '#';
        }
        return oss.str();
    }

    CsvRow CsvIO::encode(int index, const GenerationResult& g) {
        CsvRow row;
        row.index = index;
        row.level = g.level;
        row.seed = g.diag.seed;
        row.shortSide = g.pieces.empty() ? parametersForLevel(std::max(1, g.level)).shortSide : g.pieces.front().shortSide;
        row.pieces = g.total;
        row.score = g.difficultyScore;
        row.label = g.difficultyLabel;
        row.avgDepth = g.diag.avgDepth;
        row.maxDepth = g.diag.maxDepth;
        row.removableRatio = g.diag.removableRatio;
        row.fillRate = g.diag.fillRate;
        row.blocks = encodeBlocks(g.pieces);
        return row;
    }

    static std::vector<std::string> split(const std::string& s, char sep) {
        std::vector<std::string> out; std::string cur; std::istringstream iss(s);
        while (std::getline(iss, cur, sep)) out.push_back(cur);
        return out;
    }

    bool CsvIO::decode(const CsvRow& row, const BoardSpec& screen, GenerationResult& out) {
        GenerationResult g;
        g.level = row.level;
        g.screen = screen;
        g.boardRect = makeBoardRect(screen);
        g.safeRect = makeSafeRect(g.boardRect, row.shortSide);
        Lattice lattice(g.safeRect, row.shortSide);

        auto tokens = row.blocks.empty() ? std::vector<std::string>{} : split(row.blocks, '#');
        for (const auto& tok : tokens) {
            auto parts = split(tok, '_');
            if (parts.size() != 5 || parts[2].size() != 1) {
                spdlog::warn("csv row {}: malformed block '{}'", row.index, tok);
                return false;
            }
            CellCoord a; int dir = 0, type = 0;
            try {
                a = CellCoord{ std::stoi(parts[0]), std::stoi(parts[1]) };
                dir = std::stoi(parts[3]); type = std::stoi(parts[4]);
            }
            catch (const std::logic_error& e) {
                spdlog::warn("csv row {}: bad number in block '{}' ({})", row.index, tok, e.what());
                return false;
            }
            Axis axis = parts[2][0] == 'r' ? Axis::Row : Axis::Col;
            if (dir < 0 || dir >= kDirectionCount || type < 0 || type >= kCosmeticTypeCount) {
                spdlog::warn("csv row {}: block '{}' has an unknown direction or type", row.index, tok);
                return false;
            }
            CellCoord b = axis == Axis::Row ? CellCoord{ a.row + 1, a.col } : CellCoord{ a.row, a.col + 1 };
            Direction d = static_cast<Direction>(dir);
            if (axisOf(d) != axis || !lattice.isCell(a.row, a.col) || !lattice.isCell(b.row, b.col)) {
                spdlog::warn("csv row {}: block '{}' does not fit the {}x{} board", row.index, tok, screen.width, screen.height);
                return false;
            }
            Piece p = makeLatticePiece(lattice, (int)g.pieces.size(), a, b, d);
            if (!lattice.occupy(p.cells, p.id)) {
                spdlog::warn("csv row {}: block '{}' overlaps another", row.index, tok);
                return false;
            }
            p.type = static_cast<CosmeticType>(type);
            g.pieces.push_back(p);
        }

        Board board(g.pieces, screen);
        auto graph = DependencyGraph::build(board);
        for (int v = 0; v < graph.size(); ++v) g.pieces[graph.node(v).pieceIndex].depth = graph.node(v).depth;
        auto stats = graph.stats();
        g.total = (int)g.pieces.size();
        g.solvable = graph.validateSolvability().solvable;
        g.removalOrder = graph.solutionPath();
        g.difficultyScore = row.score;
        g.difficultyLabel = row.label;
        g.diag.seed = row.seed;
        g.diag.avgDepth = stats.avgDepth;
        g.diag.maxDepth = stats.maxDepth;
        g.diag.removableCount = stats.removableCount;
        g.diag.removableRatio = stats.removableRatio;
        g.diag.latticeCells = lattice.cellCount();
        g.diag.fillRate = lattice.cellCount() > 0 ? 2.0 * g.total / lattice.cellCount() : 0.0;
        out = std::move(g);
        return true;
    }

    bool CsvIO::save(const std::string& path, const std::vector<CsvRow>& rows, bool appendIfExists) {
        namespace fs = std::filesystem;
        bool exists = fs::exists(path);
        std::ofstream f(path, std::ios::out | (appendIfExists ? std::ios::app : std::ios::trunc));
        if (!f) { spdlog::warn("csv: cannot open '{}' for writing", path); return false; }
        if (!exists || !appendIfExists) f << kHeader << "\n";
        for (const auto& r : rows) {
            f << r.index << ',' << r.level << ',' << r.seed << ',' << r.shortSide << ',' << r.pieces << ','
                << r.score << ',' << r.label << ',' << r.avgDepth << ',' << r.maxDepth << ','
                << r.removableRatio << ',' << r.fillRate << ',' << r.blocks << "\n";
        }
        return static_cast<bool>(f);
    }

    std::vector<CsvRow> CsvIO::load(const std::string& path) {
        std::vector<CsvRow> out; std::ifstream f(path);
        if (!f) return out;
        std::string line; bool first = true; int lineNo = 0;
        while (std::getline(f, line)) {
            ++lineNo;
            if (first) { first = false; continue; }
            if (line.empty()) continue;
            auto cells = split(line, ',');
            if (cells.size() == 11) cells.emplace_back();  // getline drops a trailing empty field
            if (cells.size() < 12) { spdlog::warn("csv {}:{}: expected 12 fields, got {}", path, lineNo, cells.size()); continue; }
            try {
                CsvRow r; int i = 0;
                r.index = std::stoi(cells[i++]);
                r.level = std::stoi(cells[i++]);
                r.seed = static_cast<uint32_t>(std::stoul(cells[i++]));
                r.shortSide = std::stof(cells[i++]);
                r.pieces = std::stoi(cells[i++]);
                r.score = std::stod(cells[i++]);
                r.label = cells[i++];
                r.avgDepth = std::stod(cells[i++]);
                r.maxDepth = std::stoi(cells[i++]);
                r.removableRatio = std::stod(cells[i++]);
                r.fillRate = std::stod(cells[i++]);
                r.blocks = cells[i++];
                out.push_back(std::move(r));
            }
            catch (const std::logic_error& e) {
                spdlog::warn("csv {}:{}: skipped ({})", path, lineNo, e.what());
            }
        }
        return out;
    }

} // namespace lp
