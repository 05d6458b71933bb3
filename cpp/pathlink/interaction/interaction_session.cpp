#include "pathlink/interaction/interaction_session.h"
#include "pathlink/interaction/target_registry.h"
#include "pathlink/game/win_evaluator.h"
#include "pathlink/geometry/intersection.h"
#include "pathlink/engine.h"
#include "pathlink/core/logging.h"

#include <utility>

using pathlink::protocol::InteractionLogEvent;

InteractionSession::InteractionSession(PathLinkEngine& engine, TargetRegistry& registry, WinEvaluator& winEvaluator)
    : engine_(engine), registry_(registry), winEvaluator_(winEvaluator), validator_(registry)
{
    state_.committed.reserve(kCategoryCount);
}

RenderState InteractionSession::getRenderState() const noexcept {
    RenderState out{};
    out.committedPaths = &state_.committed;
    out.inProgressPath = state_.isDrawing() ? &state_.current : nullptr;
    return out;
}

void InteractionSession::evictPathsTouching(const std::string& targetId) {
    auto& committed = state_.committed;
    auto it = committed.begin();
    while (it != committed.end()) {
        if (!it->touches(targetId)) {
            ++it;
            continue;
        }
        const Category category = it->category;
        it = committed.erase(it);
        engine_.recordPathEvicted(static_cast<std::uint32_t>(committed.size()), category);
        PATHLINK_LOG_DEBUG("evicted %s path at %s", categoryName(category), targetId.c_str());
    }
}

bool InteractionSession::beginPath(const Point2& p) {
    recordLogEntry(InteractionLogEvent::Down, p.x, p.y);
    if (state_.isDrawing()) return false;

    const TargetRec* target = registry_.targetAt(p);
    if (!target) return false;
    if (!registry_.canvasContains(p)) {
        PATHLINK_LOG_DEBUG("press on %s outside canvas ignored", target->id.c_str());
        return false;
    }

    evictPathsTouching(target->id);

    state_.phase = InteractionPhase::Drawing;
    state_.current.category = target->category;
    state_.current.points.clear();
    state_.current.points.push_back(p);
    state_.current.startTargetId = target->id;
    state_.current.endTargetId.clear();
    strokeStats_ = StrokeStats{};

    PATHLINK_LOG_DEBUG("stroke start %s at (%.1f, %.1f)", target->id.c_str(), p.x, p.y);
    engine_.recordPathStarted(static_cast<std::uint32_t>(state_.committed.size()), target->category);
    engine_.markRenderDirty();
    checkInvariants();
    return true;
}

void InteractionSession::extendPath(const Point2& p) {
    recordLogEntry(InteractionLogEvent::Move, p.x, p.y);
    if (!state_.isDrawing()) return;

    const Point2& last = state_.current.points.back();
    if (pathlink::geometry::distance(last, p) < options.minPointSpacing) {
        strokeStats_.droppedMoves++;
        return;
    }

    strokeStats_.validations++;
    const ExtendVerdict verdict = validator_.canExtend(state_, p, options);
    strokeStats_.lastExtend = verdict;
    if (verdict != ExtendVerdict::Accepted) {
        PATHLINK_LOG_DEBUG("stroke rejected: %s", extendVerdictName(verdict));
        discardCurrent(CancelReason::Rejected, static_cast<std::uint32_t>(verdict));
        return;
    }

    state_.current.points.push_back(p);
    engine_.markRenderDirty();
}

bool InteractionSession::endPath(const Point2& p) {
    recordLogEntry(InteractionLogEvent::Up, p.x, p.y);
    if (!state_.isDrawing()) return false;

    const TargetRec* hit = registry_.targetAt(p);
    const TerminateVerdict verdict = validator_.canTerminate(state_, hit);
    strokeStats_.lastTerminate = verdict;
    if (verdict != TerminateVerdict::Accepted) {
        discardCurrent(CancelReason::BadRelease, static_cast<std::uint32_t>(verdict));
        return false;
    }

    evictPathsTouching(hit->id);

    PathRec path = std::move(state_.current);
    path.endTargetId = hit->id;
    const Category category = path.category;
    state_.committed.push_back(std::move(path));
    state_.current = PathRec{};
    state_.phase = InteractionPhase::Idle;

    const auto committedCount = static_cast<std::uint32_t>(state_.committed.size());
    PATHLINK_LOG_DEBUG("stroke committed %s -> %s (%u committed)",
        state_.committed.back().startTargetId.c_str(), hit->id.c_str(), committedCount);
    engine_.recordPathCommitted(committedCount, category);
    engine_.markRenderDirty();
    checkInvariants();

    winEvaluator_.checkCompletion(state_.committed.size(), engine_.now());
    return true;
}

void InteractionSession::cancelPath() {
    recordLogEntry(InteractionLogEvent::Cancel, 0.0f, 0.0f);
    if (!state_.isDrawing()) return;
    discardCurrent(CancelReason::External, 0);
}

void InteractionSession::resetSession() {
    recordLogEntry(InteractionLogEvent::Reset, 0.0f, 0.0f);
    if (state_.isDrawing()) {
        engine_.recordPathCancelled(CancelReason::Reset, 0);
    }
    state_.phase = InteractionPhase::Idle;
    state_.current = PathRec{};
    state_.committed.clear();
    strokeStats_ = StrokeStats{};
    winEvaluator_.reset();
    engine_.recordSessionReset(winEvaluator_.generation());
    engine_.markRenderDirty();
}

void InteractionSession::discardCurrent(CancelReason reason, std::uint32_t detail) {
    state_.phase = InteractionPhase::Idle;
    state_.current = PathRec{};
    engine_.recordPathCancelled(reason, detail);
    engine_.markRenderDirty();
}

void InteractionSession::checkInvariants() const {
    const auto& committed = state_.committed;
    for (std::size_t i = 0; i < committed.size(); ++i) {
        const PathRec& a = committed[i];
        if (a.endTargetId.empty() || a.startTargetId == a.endTargetId) {
            PATHLINK_LOG_WARN("committed path %zu has bad endpoints", i);
            return;
        }
        const TargetRec* start = registry_.findById(a.startTargetId);
        const TargetRec* end = registry_.findById(a.endTargetId);
        if (start && end && start->category != end->category) {
            PATHLINK_LOG_WARN("committed path %zu joins %s and %s", i,
                categoryName(start->category), categoryName(end->category));
            return;
        }
        for (std::size_t j = i + 1; j < committed.size(); ++j) {
            const PathRec& b = committed[j];
            if (b.touches(a.startTargetId) || b.touches(a.endTargetId)) {
                PATHLINK_LOG_WARN("committed paths %zu and %zu share an endpoint", i, j);
                return;
            }
        }
    }
}
