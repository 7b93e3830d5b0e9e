// ========================= src/core/Types.hpp =========================
#pragma once
#include <cstdint>
#include <vector>
#include <string>
#include <array>
#include <limits>

namespace lp {

    // Facing directions are the four diagonals of the screen (the lattice is rotated 45 degrees).
    enum class Direction : uint8_t { Up = 0, Right = 1, Down = 2, Left = 3 };
    enum class Axis : uint8_t { Row = 0, Col = 1 };   // Row: UP/DOWN pair, Col: LEFT/RIGHT pair

    constexpr int kDirectionCount = 4;
    constexpr int kInfiniteDepth = std::numeric_limits<int>::max();

    inline Axis axisOf(Direction d) { return (d == Direction::Up || d == Direction::Down) ? Axis::Row : Axis::Col; }
    inline Direction opposite(Direction d) { return static_cast<Direction>((static_cast<int>(d) + 2) % 4); }
    inline int dirIndex(Direction d) { return static_cast<int>(d); }

    // lattice step taken when moving one cell in direction d
    inline void latticeDelta(Direction d, int& dRow, int& dCol) {
        dRow = 0; dCol = 0;
        switch (d) {
        case Direction::Up: dRow = -1; break;
        case Direction::Down: dRow = 1; break;
        case Direction::Left: dCol = -1; break;
        case Direction::Right: dCol = 1; break;
        }
    }

    inline const char* directionName(Direction d) {
        static const char* names[4] = { "up", "right", "down", "left" };
        return names[dirIndex(d)];
    }

    struct Vec2 { float x{ 0 }; float y{ 0 }; };

    struct Rect {
        float x{ 0 }, y{ 0 }, width{ 0 }, height{ 0 };
        float right() const { return x + width; }
        float bottom() const { return y + height; }
        Vec2 center() const { return Vec2{ x + width * 0.5f, y + height * 0.5f }; }
        bool contains(float px, float py) const { return px >= x && px <= x + width && py >= y && py <= y + height; }
    };

    struct CellCoord {
        int row{ 0 }; int col{ 0 };
        bool operator==(const CellCoord& o) const { return row == o.row && col == o.col; }
        bool operator!=(const CellCoord& o) const { return !(*this == o); }
    };

    // Piece dimensions. Short side is the per-level "block size"; long side keeps the 45:18 art ratio.
    struct BlockSizes {
        static constexpr float kLength = 45.0f;
        static constexpr float kWidth = 18.0f;
        static constexpr float kSafetyMargin = 6.0f;
        static constexpr float kRenderMargin = 10.0f;
        static constexpr float kHitboxInset = 2.0f;
        static constexpr float kCollisionShrink = 0.125f;
    };

    enum class CosmeticType : uint8_t { Pig = 0, Sheep = 1, Dog = 2, Fox = 3, Panda = 4 };
    constexpr int kCosmeticTypeCount = 5;

    inline const char* cosmeticName(CosmeticType t) {
        static const char* names[kCosmeticTypeCount] = { "pig", "sheep", "dog", "fox", "panda" };
        return names[static_cast<int>(t)];
    }

    struct Piece {
        int id{ -1 };
        Rect rect;                       // axis-aligned pixel bounds of the rotated body
        Direction direction{ Direction::Up };
        Axis axis{ Axis::Row };
        std::array<CellCoord, 2> cells{}; // cells[0] is the anchor (smaller row/col)
        bool hasLattice{ true };         // false once an effect moved the piece off the lattice
        float shortSide{ 16.0f };
        CosmeticType type{ CosmeticType::Pig };
        int depth{ 0 };

        Vec2 center() const { return rect.center(); }
    };

    // Difficulty label bands
    inline std::string labelForScore(double s) {
        if (s < 20) return "Very Easy";
        if (s < 40) return "Easy";
        if (s < 60) return "Normal";
        if (s < 80) return "Hard";
        return "Very Hard";
    }

} // namespace lp
