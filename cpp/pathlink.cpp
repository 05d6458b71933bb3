// pathlink.cpp holds the PathLinkEngine core; the public API lives in pathlink/engine.h
#include "pathlink/engine.h"
#include "pathlink/internal/engine_state.h"
#include "pathlink/command/commands.h"
#include "pathlink/command/command_dispatch.h"
#include "pathlink/core/logging.h"

#include <cmath>
#include <utility>

namespace {
    InteractionOptions sanitizeOptions(const InteractionOptions& in) {
        const InteractionOptions defaults{};
        InteractionOptions out = in;
        if (!std::isfinite(out.minPointSpacing) || out.minPointSpacing < 0.0f) {
            out.minPointSpacing = defaults.minPointSpacing;
        }
        if (!std::isfinite(out.winDelayMs) || out.winDelayMs < 0.0) {
            out.winDelayMs = defaults.winDelayMs;
        }
        // Below two the trailing window no longer covers the segment ending
        // at the last point, and every turn reads as a self-crossing.
        if (out.selfIntersectionWindow < 2) {
            out.selfIntersectionWindow = defaults.selfIntersectionWindow;
        }
        if (out.categoryCount == 0 || out.categoryCount > kCategoryCount) {
            out.categoryCount = defaults.categoryCount;
        }
        return out;
    }
}

EngineState::EngineState(PathLinkEngine& engine)
    : interactionSession_(engine, registry_, winEvaluator_)
{
    lineVertices.reserve(256 * lineVertexFloats);
    eventQueue_.resize(kMaxEvents);
    eventBuffer_.reserve(kMaxEvents + 1);
}

PathLinkEngine::PathLinkEngine()
    : state_(std::make_unique<EngineState>(*this))
{
    const InteractionOptions& options = state().interactionSession_.options;
    state().winEvaluator_.configure(options.categoryCount, options.winDelayMs);
}

PathLinkEngine::~PathLinkEngine() = default;

void PathLinkEngine::clearError() noexcept {
    state().lastError = EngineError::Ok;
}

void PathLinkEngine::setError(EngineError err) noexcept {
    state().lastError = err;
}

EngineError PathLinkEngine::getLastError() const noexcept {
    return state().lastError;
}

// ==============================================================================
// Pointer input
// ==============================================================================

void PathLinkEngine::onPointerDown(float x, float y) {
    clearError();
    state().interactionSession_.beginPath(Point2{x, y});
}

void PathLinkEngine::onPointerMove(float x, float y) {
    clearError();
    state().interactionSession_.extendPath(Point2{x, y});
}

void PathLinkEngine::onPointerUp(float x, float y) {
    clearError();
    state().interactionSession_.endPath(Point2{x, y});
}

void PathLinkEngine::onPointerCancel() {
    clearError();
    state().interactionSession_.cancelPath();
}

// ==============================================================================
// Layout
// ==============================================================================

void PathLinkEngine::onLayoutChanged(std::vector<TargetRec> targets) {
    clearError();
    state().registry_.replace(std::move(targets));
    state().generation++;
    recordLayoutChanged(static_cast<std::uint32_t>(state().registry_.size()));
}

void PathLinkEngine::setCanvasSize(float width, float height) {
    clearError();
    state().registry_.setCanvasSize(width, height);
    state().generation++;
    recordLayoutChanged(static_cast<std::uint32_t>(state().registry_.size()));
}

void PathLinkEngine::applyLayoutCommandBuffer(std::uintptr_t ptr, std::uint32_t byteCount) {
    clearError();
    const double t0 = emscripten_get_now();
    const std::uint8_t* src = reinterpret_cast<const std::uint8_t*>(ptr);

    pathlink::PendingLayout pending;
    pending.targets = state().registry_.allTargets();

    auto commandCallback = [](void* ctx, std::uint32_t op, const std::uint8_t* payload, std::uint32_t payloadByteCount) -> EngineError {
        return pathlink::dispatchLayoutCommand(*reinterpret_cast<pathlink::PendingLayout*>(ctx), op, payload, payloadByteCount);
    };

    const EngineError err = pathlink::parseCommandBuffer(src, byteCount, commandCallback, &pending);
    if (err != EngineError::Ok) {
        PATHLINK_LOG_WARN("layout command buffer rejected (error %u)", static_cast<unsigned>(err));
        setError(err);
        return;
    }

    state().registry_.replace(std::move(pending.targets));
    if (pending.canvasChanged) {
        state().registry_.setCanvasSize(pending.canvasWidth, pending.canvasHeight);
    }
    state().generation++;
    recordLayoutChanged(static_cast<std::uint32_t>(state().registry_.size()));

    state().lastApplyMs = static_cast<float>(emscripten_get_now() - t0);
}

// ==============================================================================
// Session
// ==============================================================================

void PathLinkEngine::reset() {
    clearError();
    state().interactionSession_.resetSession();
}

void PathLinkEngine::tick() {
    std::uint32_t sessionGeneration = 0;
    if (!state().winEvaluator_.poll(now(), sessionGeneration)) {
        return;
    }
    PATHLINK_LOG_DEBUG("win delivered gen=%u", sessionGeneration);
    recordWin(sessionGeneration);
    if (state().winCallback_) {
        state().winCallback_(state().winCallbackCtx_, sessionGeneration);
    }
}

bool PathLinkEngine::isDrawing() const noexcept {
    return state().interactionSession_.isDrawing();
}

std::uint32_t PathLinkEngine::getSessionGeneration() const noexcept {
    return state().winEvaluator_.generation();
}

void PathLinkEngine::setWinCallback(WinCallback cb, void* ctx) noexcept {
    state().winCallback_ = cb;
    state().winCallbackCtx_ = ctx;
}

void PathLinkEngine::setClock(ClockFn clock, void* ctx) noexcept {
    state().clock_ = clock;
    state().clockCtx_ = ctx;
}

double PathLinkEngine::now() const {
    if (state().clock_) {
        return state().clock_(state().clockCtx_);
    }
    return emscripten_get_now();
}

void PathLinkEngine::setInteractionOptions(const InteractionOptions& options) {
    clearError();
    const InteractionOptions sanitized = sanitizeOptions(options);
    state().interactionSession_.options = sanitized;
    state().winEvaluator_.configure(sanitized.categoryCount, sanitized.winDelayMs);
}

const InteractionOptions& PathLinkEngine::getInteractionOptions() const noexcept {
    return state().interactionSession_.options;
}

// ==============================================================================
// Interaction log
// ==============================================================================

void PathLinkEngine::setInteractionLogEnabled(bool enabled, std::uint32_t maxEntries) {
    state().interactionSession_.setInteractionLogEnabled(enabled, maxEntries);
}

void PathLinkEngine::clearInteractionLog() {
    state().interactionSession_.clearInteractionLog();
}

bool PathLinkEngine::replayInteractionLog() {
    clearError();
    const bool ok = state().interactionSession_.replayInteractionLog();
    if (!ok) {
        setError(EngineError::InvalidOperation);
    }
    return ok;
}

bool PathLinkEngine::isInteractionLogOverflowed() const {
    return state().interactionSession_.isInteractionLogOverflowed();
}

std::uint32_t PathLinkEngine::getInteractionLogSize() const {
    return static_cast<std::uint32_t>(state().interactionSession_.getInteractionLogEntries().size());
}
