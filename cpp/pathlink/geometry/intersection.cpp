#include "pathlink/geometry/intersection.h"

#include <cmath>

namespace pathlink {
namespace geometry {

bool segmentsIntersect(const Point2& a0, const Point2& a1, const Point2& b0, const Point2& b1) noexcept {
    const float det = (a1.x - a0.x) * (b1.y - b0.y) - (b1.x - b0.x) * (a1.y - a0.y);
    if (det == 0.0f) {
        return false;
    }
    const float lambda = ((b1.y - b0.y) * (b1.x - a0.x) + (b0.x - b1.x) * (b1.y - a0.y)) / det;
    const float gamma = ((a0.y - a1.y) * (b1.x - a0.x) + (a1.x - a0.x) * (b1.y - a0.y)) / det;
    return (0.0f <= lambda && lambda <= 1.0f) && (0.0f <= gamma && gamma <= 1.0f);
}

bool segmentIntersectsRect(const Point2& p1, const Point2& p2, const RectF& rect) noexcept {
    const float left = rect.x;
    const float right = rect.x + rect.w;
    const float top = rect.y;
    const float bottom = rect.y + rect.h;

    const Point2 tl{left, top};
    const Point2 tr{right, top};
    const Point2 br{right, bottom};
    const Point2 bl{left, bottom};

    if (segmentsIntersect(p1, p2, tl, tr)) return true;
    if (segmentsIntersect(p1, p2, tr, br)) return true;
    if (segmentsIntersect(p1, p2, br, bl)) return true;
    if (segmentsIntersect(p1, p2, bl, tl)) return true;

    return rectContainsStrict(rect, p1);
}

bool rectContains(const RectF& rect, const Point2& p) noexcept {
    return p.x >= rect.x && p.x <= rect.x + rect.w
        && p.y >= rect.y && p.y <= rect.y + rect.h;
}

bool rectContainsStrict(const RectF& rect, const Point2& p) noexcept {
    return p.x > rect.x && p.x < rect.x + rect.w
        && p.y > rect.y && p.y < rect.y + rect.h;
}

float distance(const Point2& a, const Point2& b) noexcept {
    return std::hypot(b.x - a.x, b.y - a.y);
}

} // namespace geometry
} // namespace pathlink
