#pragma once

#ifdef EMSCRIPTEN
#include <emscripten/bind.h>
#include <emscripten/emscripten.h>
#include <emscripten/val.h>
#endif

#include "pathlink/core/types.h"
#include "pathlink/core/util.h"
#include "pathlink/interaction/interaction_types.h"
#include "pathlink/protocol/protocol_types.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

struct EngineState;

// Facade handed to the presentation shell. Input adapters feed canonical
// pointer events; the painter pulls render state; the shell services the
// deferred win timer with tick().
class PathLinkEngine {
    friend class InteractionSession;
    friend class PathLinkEngineTestAccessor;
public:
    using EventType = pathlink::protocol::EventType;
    using EngineEvent = pathlink::protocol::EngineEvent;
    using BufferMeta = pathlink::protocol::BufferMeta;
    using EventBufferMeta = pathlink::protocol::EventBufferMeta;
    using EngineStats = pathlink::protocol::EngineStats;

    // Milliseconds from an arbitrary monotonic origin.
    using ClockFn = double(*)(void* ctx);
    // Invoked once per completed session with that session's generation.
    using WinCallback = void(*)(void* ctx, std::uint32_t sessionGeneration);

    PathLinkEngine();
    ~PathLinkEngine();

    PathLinkEngine(const PathLinkEngine&) = delete;
    PathLinkEngine& operator=(const PathLinkEngine&) = delete;

    // ==============================================================================
    // Pointer input
    // ==============================================================================
    void onPointerDown(float x, float y);
    void onPointerMove(float x, float y);
    void onPointerUp(float x, float y);
    void onPointerCancel();

    // ==============================================================================
    // Layout
    // ==============================================================================
    void onLayoutChanged(std::vector<TargetRec> targets);
    void setCanvasSize(float width, float height);
    void applyLayoutCommandBuffer(std::uintptr_t ptr, std::uint32_t byteCount);

    // ==============================================================================
    // Session
    // ==============================================================================
    void reset();
    void tick();
    bool isDrawing() const noexcept;
    std::uint32_t getSessionGeneration() const noexcept;

    void setWinCallback(WinCallback cb, void* ctx) noexcept;
    void setClock(ClockFn clock, void* ctx) noexcept;
    double now() const;

    void setInteractionOptions(const InteractionOptions& options);
    const InteractionOptions& getInteractionOptions() const noexcept;

    // ==============================================================================
    // Render state
    // ==============================================================================
    RenderState getRenderState() const noexcept;
    BufferMeta getLineBufferMeta() const;
    EngineStats getStats() const;

    // ==============================================================================
    // Event stream
    // ==============================================================================
    EventBufferMeta pollEvents(std::uint32_t maxEvents);
    void ackResync(std::uint32_t resyncGeneration);

    // ==============================================================================
    // Interaction log
    // ==============================================================================
    void setInteractionLogEnabled(bool enabled, std::uint32_t maxEntries);
    void clearInteractionLog();
    bool replayInteractionLog();
    bool isInteractionLogOverflowed() const;
    std::uint32_t getInteractionLogSize() const;

    EngineError getLastError() const noexcept;

private:
    std::unique_ptr<EngineState> state_;

    EngineState& state() noexcept { return *state_; }
    const EngineState& state() const noexcept { return *state_; }

    void clearError() noexcept;
    void setError(EngineError err) noexcept;

    void markRenderDirty() noexcept;
    void rebuildLineBuffer() const;

    // Event recording (called by InteractionSession)
    void recordPathStarted(std::uint32_t committedCount, Category category);
    void recordPathCommitted(std::uint32_t committedCount, Category category);
    void recordPathCancelled(CancelReason reason, std::uint32_t detail);
    void recordPathEvicted(std::uint32_t committedCount, Category category);
    void recordWin(std::uint32_t sessionGeneration);
    void recordSessionReset(std::uint32_t sessionGeneration);
    void recordLayoutChanged(std::uint32_t targetCount);
    bool pushEvent(const EngineEvent& ev);
    void clearEventState();
};
