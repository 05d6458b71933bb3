#ifndef PATHLINK_ENGINE_TYPES_H
#define PATHLINK_ENGINE_TYPES_H

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

// Lightweight types and constants used by the path engine.

// Layout command format constants
static constexpr std::uint32_t layoutCommandMagicPllc = 0x434C4C50; // "PLLC"
static constexpr std::uint32_t layoutCommandVersion = 1;
static constexpr std::size_t commandHeaderBytes = 4 * 4;
static constexpr std::size_t perCommandHeaderBytes = 4 * 4;

// Render budgeting constants
static constexpr std::size_t lineVertexFloats = 7; // x,y,z,r,g,b,a
static constexpr std::size_t lineSegmentFloats = 2 * lineVertexFloats;

struct Point2 { float x; float y; };

// Axis-aligned rectangle in canvas space. y grows downwards, like the DOM.
struct RectF {
    float x;
    float y;
    float w;
    float h;
};

enum class Category : std::uint8_t {
    A = 0,
    B = 1,
    C = 2,
};

static constexpr std::uint32_t kCategoryCount = 3;

inline bool isValidCategory(std::uint32_t raw) noexcept {
    return raw < kCategoryCount;
}

inline const char* categoryName(Category c) noexcept {
    switch (c) {
        case Category::A: return "A";
        case Category::B: return "B";
        case Category::C: return "C";
    }
    return "?";
}

struct TargetRec {
    std::string id;
    Category category;
    RectF bounds;
};

// A committed path has endTargetId set; an in-progress one leaves it empty.
struct PathRec {
    Category category{Category::A};
    std::vector<Point2> points;
    std::string startTargetId;
    std::string endTargetId;

    bool touches(const std::string& targetId) const {
        return startTargetId == targetId || endTargetId == targetId;
    }
};

enum class EngineError : std::uint32_t {
    Ok = 0,
    InvalidMagic = 1,
    UnsupportedVersion = 2,
    BufferTruncated = 3,
    InvalidPayloadSize = 4,
    UnknownCommand = 5,
    InvalidPayload = 6,
    InvalidOperation = 7,
};

// Layout command ops (binary protocol)
enum class LayoutCommandOp : std::uint32_t {
    ClearTargets = 1,
    UpsertTarget = 2,
    SetCanvasSize = 3,
};

// Command payloads (POD)
struct TargetPayloadHeader { float x, y, w, h; std::uint32_t category; std::uint32_t idByteCount; };
struct CanvasSizePayload { float width, height; };

#endif // PATHLINK_ENGINE_TYPES_H
