#include "pathlink/render/render.h"
#include "pathlink/interaction/interaction_constants.h"

namespace pathlink {

namespace {

constexpr float kCommittedZ = 0.0f;
constexpr float kInProgressZ = 1.0f;

inline void pushVertex(std::vector<float>& out, const Point2& p, float z, const StrokeColor& c) {
    out.push_back(p.x);
    out.push_back(p.y);
    out.push_back(z);
    out.push_back(c.r);
    out.push_back(c.g);
    out.push_back(c.b);
    out.push_back(c.a);
}

} // namespace

StrokeColor categoryColor(Category category) noexcept {
    namespace palette = interaction_constants::Palette;
    switch (category) {
        case Category::A: return StrokeColor{palette::A[0], palette::A[1], palette::A[2], 1.0f};
        case Category::B: return StrokeColor{palette::B[0], palette::B[1], palette::B[2], 1.0f};
        case Category::C: return StrokeColor{palette::C[0], palette::C[1], palette::C[2], 1.0f};
    }
    return StrokeColor{1.0f, 1.0f, 1.0f, 1.0f};
}

void appendPathLineVertices(const PathRec& path, float z, std::vector<float>& lineVertices) {
    if (path.points.size() < 2) return;
    const StrokeColor color = categoryColor(path.category);
    lineVertices.reserve(lineVertices.size() + (path.points.size() - 1) * lineSegmentFloats);
    for (std::size_t i = 0; i + 1 < path.points.size(); ++i) {
        pushVertex(lineVertices, path.points[i], z, color);
        pushVertex(lineVertices, path.points[i + 1], z, color);
    }
}

void rebuildPathLineBuffer(
    const std::vector<PathRec>& committed,
    const PathRec* inProgress,
    std::vector<float>& lineVertices
) {
    lineVertices.clear();
    for (const auto& path : committed) {
        appendPathLineVertices(path, kCommittedZ, lineVertices);
    }
    if (inProgress) {
        appendPathLineVertices(*inProgress, kInProgressZ, lineVertices);
    }
}

} // namespace pathlink
