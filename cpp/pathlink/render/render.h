#ifndef PATHLINK_ENGINE_RENDER_H
#define PATHLINK_ENGINE_RENDER_H

#include "pathlink/core/types.h"
#include <vector>

namespace pathlink {

struct StrokeColor {
    float r;
    float g;
    float b;
    float a;
};

StrokeColor categoryColor(Category category) noexcept;

// Append a line list (two vertices per segment, x,y,z,r,g,b,a each) for one
// path. Paths with fewer than two points emit nothing.
void appendPathLineVertices(const PathRec& path, float z, std::vector<float>& lineVertices);

// Rebuild the whole line buffer: committed paths first, then the in-progress
// path (may be null) drawn on top.
void rebuildPathLineBuffer(
    const std::vector<PathRec>& committed,
    const PathRec* inProgress,
    std::vector<float>& lineVertices
);

} // namespace pathlink

#endif // PATHLINK_ENGINE_RENDER_H
