#pragma once

#include "pathlink/interaction/interaction_types.h"

class TargetRegistry;

// Decides whether the in-progress path may grow by one point, and whether it
// may end on a given target. Holds no state of its own.
class PathValidator {
public:
    explicit PathValidator(const TargetRegistry& registry);

    // Rules run cheapest first: canvas bounds, foreign targets, committed
    // paths, then the path's own history outside the trailing window.
    ExtendVerdict canExtend(const SessionState& session, const Point2& candidate, const InteractionOptions& options) const;

    TerminateVerdict canTerminate(const SessionState& session, const TargetRec* hitTarget) const noexcept;

private:
    const TargetRegistry& registry_;

    bool crossesForeignTarget(const PathRec& path, const Point2& from, const Point2& to) const;
};

// Index of the first segment of `points` crossed by from->to, or -1. Only the
// first `segmentLimit` segments are examined.
int findCrossedSegment(const std::vector<Point2>& points, std::size_t segmentLimit, const Point2& from, const Point2& to) noexcept;
