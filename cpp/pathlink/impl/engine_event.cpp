// PathLinkEngine event stream methods

#include "pathlink/engine.h"
#include "pathlink/internal/engine_state.h"

#include <algorithm>

using pathlink::protocol::EngineEvent;
using pathlink::protocol::EventBufferMeta;
using pathlink::protocol::EventType;

namespace {
inline EngineEvent makeEvent(EventType type, std::uint32_t a, std::uint32_t b = 0, std::uint32_t c = 0) {
    return EngineEvent{static_cast<std::uint16_t>(type), 0, a, b, c, 0};
}
} // namespace

void PathLinkEngine::clearEventState() {
    state().eventHead_ = 0;
    state().eventTail_ = 0;
    state().eventCount_ = 0;
    state().eventOverflowed_ = false;
    state().eventOverflowGeneration_ = 0;
}

bool PathLinkEngine::pushEvent(const EngineEvent& ev) {
    if (state().eventOverflowed_) return false;
    if (state().eventCount_ >= EngineState::kMaxEvents) {
        state().eventOverflowed_ = true;
        state().eventOverflowGeneration_ = state().generation;
        state().eventHead_ = 0;
        state().eventTail_ = 0;
        state().eventCount_ = 0;
        return false;
    }
    state().eventQueue_[state().eventTail_] = ev;
    state().eventTail_ = (state().eventTail_ + 1) % EngineState::kMaxEvents;
    state().eventCount_++;
    return true;
}

void PathLinkEngine::recordPathStarted(std::uint32_t committedCount, Category category) {
    pushEvent(makeEvent(EventType::PathStarted, committedCount, static_cast<std::uint32_t>(category)));
}

void PathLinkEngine::recordPathCommitted(std::uint32_t committedCount, Category category) {
    pushEvent(makeEvent(EventType::PathCommitted, committedCount, static_cast<std::uint32_t>(category)));
}

void PathLinkEngine::recordPathCancelled(CancelReason reason, std::uint32_t detail) {
    pushEvent(makeEvent(EventType::PathCancelled, 0, static_cast<std::uint32_t>(reason), detail));
}

void PathLinkEngine::recordPathEvicted(std::uint32_t committedCount, Category category) {
    pushEvent(makeEvent(EventType::PathEvicted, committedCount, static_cast<std::uint32_t>(category)));
}

void PathLinkEngine::recordWin(std::uint32_t sessionGeneration) {
    pushEvent(makeEvent(EventType::Win, sessionGeneration));
}

void PathLinkEngine::recordSessionReset(std::uint32_t sessionGeneration) {
    pushEvent(makeEvent(EventType::SessionReset, sessionGeneration));
}

void PathLinkEngine::recordLayoutChanged(std::uint32_t targetCount) {
    pushEvent(makeEvent(EventType::LayoutChanged, targetCount));
}

EventBufferMeta PathLinkEngine::pollEvents(std::uint32_t maxEvents) {
    state().eventBuffer_.clear();
    if (state().eventOverflowed_) {
        state().eventBuffer_.push_back(makeEvent(EventType::Overflow, state().eventOverflowGeneration_));
        return EventBufferMeta{
            state().generation,
            static_cast<std::uint32_t>(state().eventBuffer_.size()),
            reinterpret_cast<std::uintptr_t>(state().eventBuffer_.data()),
        };
    }

    if (state().eventCount_ == 0 || maxEvents == 0) {
        return EventBufferMeta{state().generation, 0, 0};
    }

    const std::size_t count = std::min<std::size_t>(maxEvents, state().eventCount_);
    state().eventBuffer_.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        state().eventBuffer_.push_back(state().eventQueue_[state().eventHead_]);
        state().eventHead_ = (state().eventHead_ + 1) % EngineState::kMaxEvents;
        state().eventCount_--;
    }

    return EventBufferMeta{
        state().generation,
        static_cast<std::uint32_t>(state().eventBuffer_.size()),
        reinterpret_cast<std::uintptr_t>(state().eventBuffer_.data()),
    };
}

void PathLinkEngine::ackResync(std::uint32_t resyncGeneration) {
    if (!state().eventOverflowed_) return;
    if (resyncGeneration < state().eventOverflowGeneration_) return;
    clearEventState();
}
