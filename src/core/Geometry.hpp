// ========================= src/core/Geometry.hpp =========================
#pragma once
#include "Types.hpp"

namespace lp {

    struct BoardSpec {
        float width{ 414.0f };   // screen pixels
        float height{ 896.0f };
    };

    struct PieceDimensions {
        float longSide{ 0 };
        float shortSide{ 0 };
        float bboxWidth{ 0 };
        float bboxHeight{ 0 };
        float angle{ 0 };        // radians, long axis along the facing direction
    };

    // Oriented body rectangle shrunk by the collision inset; this is what rays and overlap tests use.
    struct HitRect {
        Vec2 center;
        Vec2 axis;               // unit vector along the long side
        float halfLength{ 0 };
        float halfWidth{ 0 };

        bool contains(float px, float py) const;
    };

    Rect makeBoardRect(const BoardSpec& board);
    Rect makeSafeRect(const Rect& boardRect, float shortSide);

    Vec2 directionVector(Direction d);
    float directionAngle(Direction d);
    PieceDimensions pieceDimensions(Direction d, float shortSide);

    HitRect hitRectOf(const Piece& p);
    bool hitRectsOverlap(const HitRect& a, const HitRect& b);

} // namespace lp
