// tests/test_csv.cpp (doctest)

#include <doctest/doctest.h>

#include "io/Csv.hpp"
#include "core/Detector.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>

using lp::CsvIO;
using lp::CsvRow;
using lp::GenerationResult;

namespace lp_test_csv {

// Temp file removed on scope exit.
struct TempCsv {
    std::filesystem::path path;
    explicit TempCsv(const char* name) : path(std::filesystem::temp_directory_path() / name) {
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }
    ~TempCsv() {
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }
    std::string str() const { return path.string(); }
};

static GenerationResult level(int n) {
    lp::GenOptions opt;
    opt.honorTimeBudget = false;
    return lp::Generator(opt).makeLevel(n);
}

} // namespace lp_test_csv

TEST_CASE("Csv: encode writes one block per piece") {
    auto g = lp_test_csv::level(1);
    CsvRow row = CsvIO::encode(5, g);
    CHECK(row.index == 5);
    CHECK(row.level == 1);
    CHECK(row.seed == g.diag.seed);
    CHECK(row.pieces == g.total);
    CHECK(row.label == g.difficultyLabel);
    CHECK(row.shortSide == doctest::Approx(28.0f));
    CHECK(std::count(row.blocks.begin(), row.blocks.end(), '#') == g.total - 1);
}

TEST_CASE("Csv: save, load and decode restore the board") {
    lp_test_csv::TempCsv file("lanepuzzle_csv_restore.csv");
    auto g = lp_test_csv::level(3);
    REQUIRE(CsvIO::save(file.str(), { CsvIO::encode(0, g) }, false));

    auto rows = CsvIO::load(file.str());
    REQUIRE(rows.size() == 1);
    CHECK(rows[0].blocks == CsvIO::encode(0, g).blocks);
    CHECK(rows[0].score == doctest::Approx(g.difficultyScore).epsilon(1e-4));

    GenerationResult back;
    REQUIRE(CsvIO::decode(rows[0], g.screen, back));
    REQUIRE(back.total == g.total);
    CHECK(back.level == 3);
    CHECK(back.solvable);
    CHECK(back.diag.maxDepth == g.diag.maxDepth);
    for (int i = 0; i < g.total; ++i) {
        const auto& a = g.pieces[i];
        const auto& b = back.pieces[i];
        CHECK(a.cells[0] == b.cells[0]);
        CHECK(a.cells[1] == b.cells[1]);
        CHECK(a.direction == b.direction);
        CHECK(a.type == b.type);
        CHECK(a.depth == b.depth);
        CHECK(a.rect.x == doctest::Approx(b.rect.x));
        CHECK(a.rect.y == doctest::Approx(b.rect.y));
    }

    // the rebuilt removal order clears the board
    lp::Board board(back.pieces, back.screen);
    for (int id : back.removalOrder) {
        int idx = board.indexOfId(id);
        REQUIRE(idx >= 0);
        CHECK_FALSE(lp::isBlocked(board, idx));
        board.setRemoved(idx);
    }
    CHECK(board.activeCount() == 0);
}

TEST_CASE("Csv: append keeps a single header") {
    lp_test_csv::TempCsv file("lanepuzzle_csv_append.csv");
    auto g = lp_test_csv::level(1);
    REQUIRE(CsvIO::save(file.str(), { CsvIO::encode(0, g) }, true));
    REQUIRE(CsvIO::save(file.str(), { CsvIO::encode(1, g) }, true));

    auto rows = CsvIO::load(file.str());
    REQUIRE(rows.size() == 2);
    CHECK(rows[0].index == 0);
    CHECK(rows[1].index == 1);

    std::ifstream in(file.str());
    std::string line; int headers = 0;
    while (std::getline(in, line)) if (line.rfind("index,", 0) == 0) ++headers;
    CHECK(headers == 1);

    // overwrite mode starts over
    REQUIRE(CsvIO::save(file.str(), { CsvIO::encode(9, g) }, false));
    rows = CsvIO::load(file.str());
    REQUIRE(rows.size() == 1);
    CHECK(rows[0].index == 9);
}

TEST_CASE("Csv: malformed rows are skipped") {
    lp_test_csv::TempCsv file("lanepuzzle_csv_malformed.csv");
    {
        std::ofstream out(file.str());
        out << "index,level,seed,shortSide,pieces,score,label,avgDepth,maxDepth,removableRatio,fillRate,blocks\n";
        out << "not,a,row\n";
        out << "x,1,2,16,1,10,Easy,0,0,1,0.1,0_0_r_0_0\n";
        out << "3,1,2,16,1,10,Easy,0,0,1,0.1,0_0_r_0_0\n";
    }
    auto rows = CsvIO::load(file.str());
    REQUIRE(rows.size() == 1);
    CHECK(rows[0].index == 3);
    CHECK(rows[0].blocks == "0_0_r_0_0");

    CHECK(CsvIO::load(file.str() + ".missing").empty());
}

TEST_CASE("Csv: decode rejects blocks that do not fit") {
    CsvRow row;
    row.level = 3;
    row.shortSide = 16.0f;

    GenerationResult out;
    row.blocks = "0_0_r_0_0#0_0_c_1_1";
    CHECK_FALSE(CsvIO::decode(row, lp::BoardSpec{}, out));   // overlap

    row.blocks = "0_0_r_1_0";
    CHECK_FALSE(CsvIO::decode(row, lp::BoardSpec{}, out));   // right on a row-axis piece

    row.blocks = "0_0_r_0_9";
    CHECK_FALSE(CsvIO::decode(row, lp::BoardSpec{}, out));   // unknown type

    row.blocks = "0_zero_r_0_0";
    CHECK_FALSE(CsvIO::decode(row, lp::BoardSpec{}, out));

    row.blocks = "40_0_r_0_0";
    CHECK_FALSE(CsvIO::decode(row, lp::BoardSpec{}, out));   // off the lattice

    row.blocks = "0_0_r_0_0#-3_0_c_3_2";
    REQUIRE(CsvIO::decode(row, lp::BoardSpec{}, out));
    CHECK(out.total == 2);
    CHECK(out.pieces[1].direction == lp::Direction::Left);
    CHECK(out.pieces[1].type == lp::CosmeticType::Dog);
    CHECK(out.solvable);
    CHECK(out.removalOrder.size() == 2);
}
