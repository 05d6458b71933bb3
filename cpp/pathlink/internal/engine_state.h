#pragma once

#include "pathlink/core/types.h"
#include "pathlink/engine.h"
#include "pathlink/interaction/target_registry.h"
#include "pathlink/interaction/interaction_session.h"
#include "pathlink/game/win_evaluator.h"
#include "pathlink/protocol/protocol_types.h"

#include <cstddef>
#include <cstdint>
#include <vector>

class PathLinkEngine;

struct EngineState {
    explicit EngineState(PathLinkEngine& engine);

    EngineState(const EngineState&) = delete;
    EngineState& operator=(const EngineState&) = delete;

    TargetRegistry registry_;
    WinEvaluator winEvaluator_;
    InteractionSession interactionSession_;

    PathLinkEngine::ClockFn clock_{nullptr};
    void* clockCtx_{nullptr};
    PathLinkEngine::WinCallback winCallback_{nullptr};
    void* winCallbackCtx_{nullptr};

    mutable std::vector<float> lineVertices;
    mutable bool renderDirty{true};
    std::uint32_t generation{1};
    mutable float lastRebuildMs{0.0f};
    float lastApplyMs{0.0f};
    EngineError lastError{EngineError::Ok};

    static constexpr std::size_t kMaxEvents = 2048;
    std::vector<pathlink::protocol::EngineEvent> eventQueue_{};
    std::size_t eventHead_{0};
    std::size_t eventTail_{0};
    std::size_t eventCount_{0};
    bool eventOverflowed_{false};
    std::uint32_t eventOverflowGeneration_{0};
    std::vector<pathlink::protocol::EngineEvent> eventBuffer_{};
};
