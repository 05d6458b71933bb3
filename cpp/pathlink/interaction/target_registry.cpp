#include "pathlink/interaction/target_registry.h"
#include "pathlink/geometry/intersection.h"

#include <cmath>

void TargetRegistry::replace(std::vector<TargetRec> targets) {
    targets_.swap(targets);
}

void TargetRegistry::clear() {
    targets_.clear();
}

void TargetRegistry::setCanvasSize(float width, float height) {
    canvasWidth_ = (std::isfinite(width) && width > 0.0f) ? width : 0.0f;
    canvasHeight_ = (std::isfinite(height) && height > 0.0f) ? height : 0.0f;
}

bool TargetRegistry::canvasContains(const Point2& p) const noexcept {
    return p.x >= 0.0f && p.x <= canvasWidth_
        && p.y >= 0.0f && p.y <= canvasHeight_;
}

const TargetRec* TargetRegistry::targetAt(const Point2& p) const noexcept {
    for (const auto& target : targets_) {
        if (pathlink::geometry::rectContains(target.bounds, p)) {
            return &target;
        }
    }
    return nullptr;
}

const TargetRec* TargetRegistry::findById(const std::string& id) const noexcept {
    for (const auto& target : targets_) {
        if (target.id == id) {
            return &target;
        }
    }
    return nullptr;
}
