/**
 * @file protocol_types.h
 * @brief POD types exchanged between PathLinkEngine and the presentation shell.
 *
 * These structs are read directly out of WASM linear memory by the shell, so
 * field order and widths are part of the protocol.
 */

#ifndef PATHLINK_PROTOCOL_TYPES_H
#define PATHLINK_PROTOCOL_TYPES_H

#include <cstdint>

namespace pathlink {
namespace protocol {

// =============================================================================
// Event Stream
// =============================================================================

enum class EventType : std::uint16_t {
    Overflow = 1,
    PathStarted = 2,      // a = committed count, b = category
    PathCommitted = 3,    // a = committed count, b = category
    PathCancelled = 4,    // b = CancelReason, c = ExtendVerdict/TerminateVerdict
    PathEvicted = 5,      // a = committed count after eviction, b = category
    Win = 6,              // a = session generation
    SessionReset = 7,     // a = new session generation
    LayoutChanged = 8,    // a = target count
};

struct EngineEvent {
    std::uint16_t type;
    std::uint16_t flags;
    std::uint32_t a;
    std::uint32_t b;
    std::uint32_t c;
    std::uint32_t d;
};

struct EventBufferMeta {
    std::uint32_t generation;
    std::uint32_t count;
    std::uintptr_t ptr;
};

// =============================================================================
// Buffer Metadata
// =============================================================================

struct BufferMeta {
    std::uint32_t generation;
    std::uint32_t vertexCount;
    std::uint32_t capacity;   // in vertices
    std::uint32_t floatCount; // convenience for view length
    std::uintptr_t ptr;       // byte offset in WASM linear memory
};

// =============================================================================
// Stats
// =============================================================================

struct EngineStats {
    std::uint32_t generation;
    std::uint32_t sessionGeneration;
    std::uint32_t targetCount;
    std::uint32_t committedPathCount;
    std::uint32_t inProgressPointCount;
    std::uint32_t lineVertexCount;
    float lastApplyMs;
    float lastRebuildMs;
};

// =============================================================================
// Interaction Log
// =============================================================================

enum class InteractionLogEvent : std::uint32_t {
    Down = 1,
    Move = 2,
    Up = 3,
    Cancel = 4,
    Reset = 5,
};

struct InteractionLogEntry {
    std::uint32_t type;
    float x;
    float y;
};

} // namespace protocol
} // namespace pathlink

#endif // PATHLINK_PROTOCOL_TYPES_H
