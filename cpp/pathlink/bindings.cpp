#ifdef EMSCRIPTEN
#include <emscripten/bind.h>
#include <emscripten/emscripten.h>
#include <emscripten/val.h>
#endif

// Include the engine public API header for bindings.
#include "pathlink/engine.h"
#include "pathlink/interaction/interaction_constants.h"

#ifdef EMSCRIPTEN
EMSCRIPTEN_BINDINGS(pathlink_engine_module) {
    emscripten::constant("STROKE_WIDTH_PX", interaction_constants::STROKE_WIDTH_PX);

    emscripten::enum_<Category>("Category")
        .value("A", Category::A)
        .value("B", Category::B)
        .value("C", Category::C);

    emscripten::enum_<EngineError>("EngineError")
        .value("Ok", EngineError::Ok)
        .value("InvalidMagic", EngineError::InvalidMagic)
        .value("UnsupportedVersion", EngineError::UnsupportedVersion)
        .value("BufferTruncated", EngineError::BufferTruncated)
        .value("InvalidPayloadSize", EngineError::InvalidPayloadSize)
        .value("UnknownCommand", EngineError::UnknownCommand)
        .value("InvalidPayload", EngineError::InvalidPayload)
        .value("InvalidOperation", EngineError::InvalidOperation);

    emscripten::value_object<RectF>("RectF")
        .field("x", &RectF::x)
        .field("y", &RectF::y)
        .field("w", &RectF::w)
        .field("h", &RectF::h);

    emscripten::value_object<TargetRec>("TargetRec")
        .field("id", &TargetRec::id)
        .field("category", &TargetRec::category)
        .field("bounds", &TargetRec::bounds);

    emscripten::register_vector<TargetRec>("TargetRecVector");

    emscripten::value_object<InteractionOptions>("InteractionOptions")
        .field("minPointSpacing", &InteractionOptions::minPointSpacing)
        .field("selfIntersectionWindow", &InteractionOptions::selfIntersectionWindow)
        .field("winDelayMs", &InteractionOptions::winDelayMs)
        .field("categoryCount", &InteractionOptions::categoryCount);

    emscripten::value_object<PathLinkEngine::BufferMeta>("BufferMeta")
        .field("generation", &PathLinkEngine::BufferMeta::generation)
        .field("vertexCount", &PathLinkEngine::BufferMeta::vertexCount)
        .field("capacity", &PathLinkEngine::BufferMeta::capacity)
        .field("floatCount", &PathLinkEngine::BufferMeta::floatCount)
        .field("ptr", &PathLinkEngine::BufferMeta::ptr);

    emscripten::value_object<PathLinkEngine::EventBufferMeta>("EventBufferMeta")
        .field("generation", &PathLinkEngine::EventBufferMeta::generation)
        .field("count", &PathLinkEngine::EventBufferMeta::count)
        .field("ptr", &PathLinkEngine::EventBufferMeta::ptr);

    emscripten::value_object<PathLinkEngine::EngineStats>("EngineStats")
        .field("generation", &PathLinkEngine::EngineStats::generation)
        .field("sessionGeneration", &PathLinkEngine::EngineStats::sessionGeneration)
        .field("targetCount", &PathLinkEngine::EngineStats::targetCount)
        .field("committedPathCount", &PathLinkEngine::EngineStats::committedPathCount)
        .field("inProgressPointCount", &PathLinkEngine::EngineStats::inProgressPointCount)
        .field("lineVertexCount", &PathLinkEngine::EngineStats::lineVertexCount)
        .field("lastApplyMs", &PathLinkEngine::EngineStats::lastApplyMs)
        .field("lastRebuildMs", &PathLinkEngine::EngineStats::lastRebuildMs);

    emscripten::class_<PathLinkEngine>("PathLinkEngine")
        .constructor<>()
        .function("onPointerDown", &PathLinkEngine::onPointerDown)
        .function("onPointerMove", &PathLinkEngine::onPointerMove)
        .function("onPointerUp", &PathLinkEngine::onPointerUp)
        .function("onPointerCancel", &PathLinkEngine::onPointerCancel)
        .function("onLayoutChanged", &PathLinkEngine::onLayoutChanged)
        .function("setCanvasSize", &PathLinkEngine::setCanvasSize)
        .function("applyLayoutCommandBuffer", &PathLinkEngine::applyLayoutCommandBuffer)
        .function("reset", &PathLinkEngine::reset)
        .function("tick", &PathLinkEngine::tick)
        .function("isDrawing", &PathLinkEngine::isDrawing)
        .function("getSessionGeneration", &PathLinkEngine::getSessionGeneration)
        .function("setInteractionOptions", &PathLinkEngine::setInteractionOptions)
        .function("getInteractionOptions", &PathLinkEngine::getInteractionOptions)
        .function("getLineBufferMeta", &PathLinkEngine::getLineBufferMeta)
        .function("getStats", &PathLinkEngine::getStats)
        .function("pollEvents", &PathLinkEngine::pollEvents)
        .function("ackResync", &PathLinkEngine::ackResync)
        .function("setInteractionLogEnabled", &PathLinkEngine::setInteractionLogEnabled)
        .function("clearInteractionLog", &PathLinkEngine::clearInteractionLog)
        .function("replayInteractionLog", &PathLinkEngine::replayInteractionLog)
        .function("isInteractionLogOverflowed", &PathLinkEngine::isInteractionLogOverflowed)
        .function("getInteractionLogSize", &PathLinkEngine::getInteractionLogSize)
        .function("getLastError", &PathLinkEngine::getLastError);
}
#endif
