#include <gtest/gtest.h>
#include "pathlink/geometry/intersection.h"

#include <cmath>
#include <cstdint>

using namespace pathlink::geometry;

namespace {
// Deterministic LCG so failures reproduce.
struct Lcg {
    std::uint64_t s = 0x2545F4914F6CDD1DULL;
    double next() {
        s = s * 6364136223846793005ULL + 1442695040888963407ULL;
        return static_cast<double>(s >> 11) / static_cast<double>(1ULL << 53);
    }
    float coord() { return static_cast<float>(next() * 200.0 - 100.0); }
};

double cross(double ax, double ay, double bx, double by) {
    return ax * by - ay * bx;
}
} // namespace

TEST(GeometryTest, CrossingSegmentsIntersect) {
    EXPECT_TRUE(segmentsIntersect({0, 0}, {2, 0}, {1, -1}, {1, 1}));
    EXPECT_TRUE(segmentsIntersect({0, 0}, {10, 10}, {0, 10}, {10, 0}));
}

TEST(GeometryTest, DisjointSegmentsDoNotIntersect) {
    EXPECT_FALSE(segmentsIntersect({0, 0}, {1, 0}, {2, -1}, {2, 1}));
    EXPECT_FALSE(segmentsIntersect({0, 0}, {1, 1}, {0, 5}, {5, 10}));
}

TEST(GeometryTest, TouchingEndpointsCountAsIntersection) {
    EXPECT_TRUE(segmentsIntersect({0, 0}, {1, 0}, {1, 0}, {1, 5}));
    EXPECT_TRUE(segmentsIntersect({0, 0}, {2, 0}, {1, 0}, {1, 3}));
}

TEST(GeometryTest, ParallelAndCollinearSegmentsNeverIntersect) {
    EXPECT_FALSE(segmentsIntersect({0, 0}, {10, 0}, {0, 1}, {10, 1}));
    // Overlapping collinear segments are reported as non-intersecting.
    EXPECT_FALSE(segmentsIntersect({0, 0}, {10, 0}, {5, 0}, {15, 0}));
    EXPECT_FALSE(segmentsIntersect({0, 0}, {10, 10}, {2, 2}, {4, 4}));
    // Degenerate (zero-length) segments have a zero determinant too.
    EXPECT_FALSE(segmentsIntersect({3, 3}, {3, 3}, {0, 0}, {6, 6}));
}

TEST(GeometryTest, AgreesWithDirectParametricSolve) {
    Lcg rng;
    int compared = 0;
    for (int i = 0; i < 2000; ++i) {
        const Point2 a0{rng.coord(), rng.coord()};
        const Point2 a1{rng.coord(), rng.coord()};
        const Point2 b0{rng.coord(), rng.coord()};
        const Point2 b1{rng.coord(), rng.coord()};

        const double rx = a1.x - a0.x, ry = a1.y - a0.y;
        const double sx = b1.x - b0.x, sy = b1.y - b0.y;
        const double denom = cross(rx, ry, sx, sy);
        if (std::fabs(denom) < 1e-3) continue;
        const double qx = b0.x - a0.x, qy = b0.y - a0.y;
        const double t = cross(qx, qy, sx, sy) / denom;
        const double u = cross(qx, qy, rx, ry) / denom;
        // Skip near-boundary cases where float rounding could legitimately flip the answer.
        const double eps = 1e-4;
        if (std::fabs(t) < eps || std::fabs(t - 1.0) < eps || std::fabs(u) < eps || std::fabs(u - 1.0) < eps) continue;

        const bool expected = t >= 0.0 && t <= 1.0 && u >= 0.0 && u <= 1.0;
        EXPECT_EQ(segmentsIntersect(a0, a1, b0, b1), expected) << "sample " << i;
        ++compared;
    }
    EXPECT_GT(compared, 1000);
}

TEST(GeometryTest, SegmentCrossingRectEdgeHitsRect) {
    const RectF rect{10, 10, 20, 20};
    EXPECT_TRUE(segmentIntersectsRect({0, 20}, {15, 20}, rect));   // enters through left edge
    EXPECT_TRUE(segmentIntersectsRect({0, 20}, {40, 20}, rect));   // passes straight through
    EXPECT_TRUE(segmentIntersectsRect({20, 0}, {20, 10}, rect));   // ends on top edge
    EXPECT_FALSE(segmentIntersectsRect({0, 0}, {5, 40}, rect));    // misses entirely
}

TEST(GeometryTest, PointStrictlyInsideRectHitsRect) {
    const RectF rect{10, 10, 20, 20};
    const Point2 inside{15, 25};
    EXPECT_TRUE(segmentIntersectsRect(inside, inside, rect));
    EXPECT_TRUE(segmentIntersectsRect(inside, {16, 24}, rect));
    EXPECT_TRUE(segmentIntersectsRect(inside, {100, 100}, rect));
}

TEST(GeometryTest, OnlyFirstEndpointIsTestedForContainment) {
    const RectF rect{10, 10, 20, 20};
    // Starts outside, ends strictly inside: only an edge crossing can report it.
    EXPECT_TRUE(segmentIntersectsRect({0, 20}, {20, 20}, rect));
    // A degenerate segment sitting outside never hits.
    EXPECT_FALSE(segmentIntersectsRect({5, 5}, {5, 5}, rect));
}

TEST(GeometryTest, SegmentRunningAlongEdgeIsNotAHit) {
    const RectF rect{10, 10, 20, 20};
    // Collinear with the top edge and starting outside: every edge test is
    // either parallel or misses, and p1 is not in the open interior.
    EXPECT_FALSE(segmentIntersectsRect({0, 10}, {5, 10}, rect));
}

TEST(GeometryTest, RectContainmentEdgesInclusiveVersusStrict) {
    const RectF rect{0, 0, 10, 10};
    EXPECT_TRUE(rectContains(rect, {0, 0}));
    EXPECT_TRUE(rectContains(rect, {10, 10}));
    EXPECT_TRUE(rectContains(rect, {5, 10}));
    EXPECT_FALSE(rectContains(rect, {10.5f, 5}));

    EXPECT_FALSE(rectContainsStrict(rect, {0, 5}));
    EXPECT_FALSE(rectContainsStrict(rect, {10, 10}));
    EXPECT_TRUE(rectContainsStrict(rect, {5, 5}));
}

TEST(GeometryTest, DistanceIsEuclidean) {
    EXPECT_FLOAT_EQ(distance({0, 0}, {3, 4}), 5.0f);
    EXPECT_FLOAT_EQ(distance({1, 1}, {1, 1}), 0.0f);
}
