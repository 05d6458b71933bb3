#pragma once

#include "pathlink/core/types.h"

namespace pathlink {
namespace geometry {

// Parametric segment test. Parallel and collinear segments (zero determinant)
// are reported as non-intersecting, overlapping ones included.
bool segmentsIntersect(const Point2& a0, const Point2& a1, const Point2& b0, const Point2& b1) noexcept;

// True if p1->p2 crosses any edge of rect, or if p1 lies strictly inside it.
// Only p1 is tested for containment: callers feed short incremental segments
// whose p1 is the previously accepted point.
bool segmentIntersectsRect(const Point2& p1, const Point2& p2, const RectF& rect) noexcept;

// Inclusive on all four edges.
bool rectContains(const RectF& rect, const Point2& p) noexcept;

// Open interior only.
bool rectContainsStrict(const RectF& rect, const Point2& p) noexcept;

float distance(const Point2& a, const Point2& b) noexcept;

} // namespace geometry
} // namespace pathlink
