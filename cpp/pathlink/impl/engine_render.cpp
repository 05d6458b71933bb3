// PathLinkEngine render-state queries

#include "pathlink/engine.h"
#include "pathlink/internal/engine_state.h"
#include "pathlink/render/render.h"

void PathLinkEngine::markRenderDirty() noexcept {
    state().renderDirty = true;
    state().generation++;
}

void PathLinkEngine::rebuildLineBuffer() const {
    const double t0 = emscripten_get_now();
    const SessionState& session = state().interactionSession_.state();
    pathlink::rebuildPathLineBuffer(
        session.committed,
        session.isDrawing() ? &session.current : nullptr,
        state().lineVertices);
    state().renderDirty = false;
    state().lastRebuildMs = static_cast<float>(emscripten_get_now() - t0);
}

RenderState PathLinkEngine::getRenderState() const noexcept {
    return state().interactionSession_.getRenderState();
}

PathLinkEngine::BufferMeta PathLinkEngine::getLineBufferMeta() const {
    if (state().renderDirty) {
        rebuildLineBuffer();
    }
    const auto& buffer = state().lineVertices;
    const std::uint32_t vertexCount = static_cast<std::uint32_t>(buffer.size() / lineVertexFloats);
    const std::uint32_t capacityVertices = static_cast<std::uint32_t>(buffer.capacity() / lineVertexFloats);
    return BufferMeta{
        state().generation,
        vertexCount,
        capacityVertices,
        static_cast<std::uint32_t>(buffer.size()),
        reinterpret_cast<std::uintptr_t>(buffer.data()),
    };
}

PathLinkEngine::EngineStats PathLinkEngine::getStats() const {
    const SessionState& session = state().interactionSession_.state();
    if (state().renderDirty) {
        rebuildLineBuffer();
    }
    EngineStats stats{};
    stats.generation = state().generation;
    stats.sessionGeneration = state().winEvaluator_.generation();
    stats.targetCount = static_cast<std::uint32_t>(state().registry_.size());
    stats.committedPathCount = static_cast<std::uint32_t>(session.committed.size());
    stats.inProgressPointCount = session.isDrawing() ? static_cast<std::uint32_t>(session.current.points.size()) : 0;
    stats.lineVertexCount = static_cast<std::uint32_t>(state().lineVertices.size() / lineVertexFloats);
    stats.lastApplyMs = state().lastApplyMs;
    stats.lastRebuildMs = state().lastRebuildMs;
    return stats;
}
