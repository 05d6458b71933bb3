#include "pathlink/interaction/path_validator.h"
#include "pathlink/interaction/target_registry.h"
#include "pathlink/geometry/intersection.h"

using pathlink::geometry::segmentIntersectsRect;
using pathlink::geometry::segmentsIntersect;

int findCrossedSegment(const std::vector<Point2>& points, std::size_t segmentLimit, const Point2& from, const Point2& to) noexcept {
    if (points.size() < 2) return -1;
    const std::size_t segmentCount = points.size() - 1;
    const std::size_t limit = segmentLimit < segmentCount ? segmentLimit : segmentCount;
    for (std::size_t i = 0; i < limit; ++i) {
        if (segmentsIntersect(from, to, points[i], points[i + 1])) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

PathValidator::PathValidator(const TargetRegistry& registry)
    : registry_(registry) {}

bool PathValidator::crossesForeignTarget(const PathRec& path, const Point2& from, const Point2& to) const {
    for (const auto& target : registry_.allTargets()) {
        // Same-family boxes (the start box included) may be grazed.
        if (target.id == path.startTargetId) continue;
        if (target.category == path.category) continue;
        if (segmentIntersectsRect(from, to, target.bounds)) {
            return true;
        }
    }
    return false;
}

ExtendVerdict PathValidator::canExtend(const SessionState& session, const Point2& candidate, const InteractionOptions& options) const {
    const PathRec& path = session.current;
    if (!session.isDrawing() || path.points.empty()) {
        return ExtendVerdict::NoPath;
    }
    const Point2& last = path.points.back();

    if (!registry_.canvasContains(candidate)) {
        return ExtendVerdict::OutOfCanvas;
    }

    if (crossesForeignTarget(path, last, candidate)) {
        return ExtendVerdict::CrossesForeignTarget;
    }

    for (const auto& other : session.committed) {
        if (findCrossedSegment(other.points, other.points.size(), last, candidate) >= 0) {
            return ExtendVerdict::CrossesCommittedPath;
        }
    }

    const std::size_t window = options.selfIntersectionWindow;
    if (path.points.size() > window) {
        if (findCrossedSegment(path.points, path.points.size() - window, last, candidate) >= 0) {
            return ExtendVerdict::CrossesSelf;
        }
    }

    return ExtendVerdict::Accepted;
}

TerminateVerdict PathValidator::canTerminate(const SessionState& session, const TargetRec* hitTarget) const noexcept {
    if (!hitTarget) return TerminateVerdict::NoTarget;
    if (hitTarget->category != session.current.category) return TerminateVerdict::CategoryMismatch;
    if (hitTarget->id == session.current.startTargetId) return TerminateVerdict::SameTarget;
    return TerminateVerdict::Accepted;
}
