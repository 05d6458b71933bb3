#pragma once

#include "pathlink/core/types.h"

#include <cstdint>
#include <vector>

namespace pathlink {

// Layout being assembled from a command buffer. It starts as a copy of the
// live snapshot and is swapped in only if every command applied cleanly.
struct PendingLayout {
    std::vector<TargetRec> targets;
    bool canvasChanged = false;
    float canvasWidth = 0.0f;
    float canvasHeight = 0.0f;
};

EngineError dispatchLayoutCommand(
    PendingLayout& layout,
    std::uint32_t op,
    const std::uint8_t* payload,
    std::uint32_t payloadByteCount
);

} // namespace pathlink
