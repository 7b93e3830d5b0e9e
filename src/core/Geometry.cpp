// ========================= src/core/Geometry.cpp =========================
#include "Geometry.hpp"
#include <algorithm>
#include <cmath>

namespace lp {

    static constexpr float kPi = 3.14159265358979323846f;
    static constexpr float kInvSqrt2 = 0.70710678118654752f;

    static constexpr float kBoardInsetX = 4.0f;
    static constexpr float kBoardTop = 120.0f;       // title bar + level header
    static constexpr float kBoardBottomReserve = 120.0f; // prop buttons + bottom padding

    bool HitRect::contains(float px, float py) const {
        float dx = px - center.x, dy = py - center.y;
        float along = dx * axis.x + dy * axis.y;
        float across = -dx * axis.y + dy * axis.x;
        return std::fabs(along) <= halfLength && std::fabs(across) <= halfWidth;
    }

    Rect makeBoardRect(const BoardSpec& board) {
        Rect r;
        r.x = kBoardInsetX;
        r.y = kBoardTop;
        r.width = std::max(0.0f, board.width - kBoardInsetX * 2);
        r.height = std::max(0.0f, board.height - kBoardTop - kBoardBottomReserve);
        return r;
    }

    Rect makeSafeRect(const Rect& boardRect, float shortSide) {
        // every direction is diagonal, so a single bbox size covers all pieces
        auto dims = pieceDimensions(Direction::Up, shortSide);
        float marginX = BlockSizes::kSafetyMargin + dims.bboxWidth * 0.5f + BlockSizes::kRenderMargin;
        float marginY = BlockSizes::kSafetyMargin + dims.bboxHeight * 0.5f + BlockSizes::kRenderMargin;
        Rect r;
        r.x = boardRect.x + marginX;
        r.y = boardRect.y + marginY;
        r.width = std::max(0.0f, boardRect.width - marginX * 2);
        r.height = std::max(0.0f, boardRect.height - marginY * 2);
        return r;
    }

    Vec2 directionVector(Direction d) {
        switch (d) {
        case Direction::Up: return Vec2{ kInvSqrt2, -kInvSqrt2 };
        case Direction::Right: return Vec2{ kInvSqrt2, kInvSqrt2 };
        case Direction::Down: return Vec2{ -kInvSqrt2, kInvSqrt2 };
        case Direction::Left: return Vec2{ -kInvSqrt2, -kInvSqrt2 };
        }
        return Vec2{};
    }

    float directionAngle(Direction d) {
        switch (d) {
        case Direction::Up: return -kPi / 4;
        case Direction::Right: return kPi / 4;
        case Direction::Down: return 3 * kPi / 4;
        case Direction::Left: return -3 * kPi / 4;
        }
        return 0.0f;
    }

    PieceDimensions pieceDimensions(Direction d, float shortSide) {
        PieceDimensions dims;
        dims.shortSide = shortSide;
        dims.longSide = shortSide * (BlockSizes::kLength / BlockSizes::kWidth);
        dims.angle = directionAngle(d);
        float c = std::fabs(std::cos(dims.angle)), s = std::fabs(std::sin(dims.angle));
        dims.bboxWidth = c * dims.longSide + s * dims.shortSide;
        dims.bboxHeight = s * dims.longSide + c * dims.shortSide;
        return dims;
    }

    HitRect hitRectOf(const Piece& p) {
        auto dims = pieceDimensions(p.direction, p.shortSide);
        float inset = std::max(BlockSizes::kHitboxInset, p.shortSide * BlockSizes::kCollisionShrink);
        HitRect h;
        h.center = p.center();
        h.axis = directionVector(p.direction);
        h.halfLength = std::max(0.0f, dims.longSide * 0.5f - inset);
        h.halfWidth = std::max(0.0f, dims.shortSide * 0.5f - inset);
        return h;
    }

    // separating axis test over the four edge normals
    static void project(const HitRect& r, Vec2 n, float& lo, float& hi) {
        float c = r.center.x * n.x + r.center.y * n.y;
        float ext = r.halfLength * std::fabs(r.axis.x * n.x + r.axis.y * n.y)
            + r.halfWidth * std::fabs(-r.axis.y * n.x + r.axis.x * n.y);
        lo = c - ext; hi = c + ext;
    }

    bool hitRectsOverlap(const HitRect& a, const HitRect& b) {
        const Vec2 axes[4] = { a.axis, Vec2{ -a.axis.y, a.axis.x }, b.axis, Vec2{ -b.axis.y, b.axis.x } };
        for (const auto& n : axes) {
            float aLo, aHi, bLo, bHi;
            project(a, n, aLo, aHi); project(b, n, bLo, bHi);
            if (aHi <= bLo || bHi <= aLo) return false;
        }
        return true;
    }

} // namespace lp
