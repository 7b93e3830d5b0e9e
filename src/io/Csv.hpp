// ========================= src/io/Csv.hpp =========================
#pragma once
#include "../core/Generator.hpp"
#include <string>
#include <vector>

namespace lp {

    struct CsvRow {
        int index{ 0 };             // map number in the file
        int level{ 1 };
        uint32_t seed{ 0 };
        float shortSide{ 16.0f };
        int pieces{ 0 };
        double score{ 0 };
        std::string label;
        double avgDepth{ 0 };
        int maxDepth{ 0 };
        double removableRatio{ 0 };
        double fillRate{ 0 };
        std::string blocks;         // row_col_axis_dir_type per piece, '#' separated, ordered by id
    };

    struct CsvIO {
        static CsvRow encode(int index, const GenerationResult& g);
        // Rebuilds pixel rects on the lattice of `screen`; depths and removal order come from the graph.
        static bool decode(const CsvRow& row, const BoardSpec& screen, GenerationResult& out);

        static bool save(const std::string& path, const std::vector<CsvRow>& rows, bool appendIfExists = true);
        static std::vector<CsvRow> load(const std::string& path);
    };

} // namespace lp
