#pragma once

#include "pathlink/core/types.h"

#include <string>
#include <vector>

// Snapshot of the interactive targets and the canvas they live on.
// The layout collaborator owns the contents; the engine only queries them.
class TargetRegistry {
public:
    TargetRegistry() = default;

    // Replaces the whole snapshot. Readers never see a partial list.
    void replace(std::vector<TargetRec> targets);
    void clear();

    void setCanvasSize(float width, float height);
    float canvasWidth() const noexcept { return canvasWidth_; }
    float canvasHeight() const noexcept { return canvasHeight_; }
    bool canvasContains(const Point2& p) const noexcept;

    // First target (in snapshot order) whose bounds contain p, edges inclusive.
    const TargetRec* targetAt(const Point2& p) const noexcept;
    const TargetRec* findById(const std::string& id) const noexcept;

    const std::vector<TargetRec>& allTargets() const noexcept { return targets_; }
    std::size_t size() const noexcept { return targets_.size(); }

private:
    std::vector<TargetRec> targets_;
    float canvasWidth_{0.0f};
    float canvasHeight_{0.0f};
};
