#pragma once

#include "pathlink/core/types.h"
#include "pathlink/interaction/interaction_constants.h"

#include <cstdint>
#include <vector>

// Runtime-tunable interaction settings. Defaults match the reference puzzle.
struct InteractionOptions {
    float minPointSpacing = interaction_constants::MIN_POINT_SPACING;
    std::uint32_t selfIntersectionWindow = interaction_constants::SELF_INTERSECTION_WINDOW;
    double winDelayMs = interaction_constants::WIN_NOTIFY_DELAY_MS;
    std::uint32_t categoryCount = kCategoryCount;
};

enum class InteractionPhase : std::uint8_t {
    Idle = 0,
    Drawing = 1,
};

enum class ExtendVerdict : std::uint8_t {
    Accepted = 0,
    OutOfCanvas = 1,
    CrossesForeignTarget = 2,
    CrossesCommittedPath = 3,
    CrossesSelf = 4,
    NoPath = 5,
};

enum class TerminateVerdict : std::uint8_t {
    Accepted = 0,
    NoTarget = 1,
    CategoryMismatch = 2,
    SameTarget = 3,
};

// Why an in-progress path was dropped. Reported through the event stream.
enum class CancelReason : std::uint32_t {
    Rejected = 1,       // an extension failed validation
    BadRelease = 2,     // released over nothing, a foreign target or the start target
    External = 3,       // pointer left the surface
    Reset = 4,
};

struct SessionState {
    InteractionPhase phase = InteractionPhase::Idle;
    PathRec current;                // meaningful only while Drawing
    std::vector<PathRec> committed;

    bool isDrawing() const noexcept { return phase == InteractionPhase::Drawing; }
};

// Read-only view handed to painters.
struct RenderState {
    const std::vector<PathRec>* committedPaths;
    const PathRec* inProgressPath; // nullptr when idle
};

inline const char* extendVerdictName(ExtendVerdict v) noexcept {
    switch (v) {
        case ExtendVerdict::Accepted: return "accepted";
        case ExtendVerdict::OutOfCanvas: return "out-of-canvas";
        case ExtendVerdict::CrossesForeignTarget: return "crosses-foreign-target";
        case ExtendVerdict::CrossesCommittedPath: return "crosses-committed-path";
        case ExtendVerdict::CrossesSelf: return "crosses-self";
        case ExtendVerdict::NoPath: return "no-path";
    }
    return "unknown";
}
