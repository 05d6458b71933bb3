#include "pathlink/interaction/interaction_session.h"
#include "pathlink/core/logging.h"

using pathlink::protocol::InteractionLogEntry;
using pathlink::protocol::InteractionLogEvent;

void InteractionSession::setInteractionLogEnabled(bool enabled, std::uint32_t maxEntries) {
    logEnabled_ = enabled;
    logOverflowed_ = false;
    logCapacity_ = maxEntries;
    logEntries_.clear();
    if (!enabled) return;
    if (logCapacity_ > 0) {
        logEntries_.reserve(logCapacity_);
    }
}

void InteractionSession::clearInteractionLog() {
    logEntries_.clear();
    logOverflowed_ = false;
}

void InteractionSession::recordLogEntry(InteractionLogEvent type, float x, float y) {
    if (!logEnabled_ || replaying_ || logOverflowed_) return;
    if (logCapacity_ > 0 && logEntries_.size() >= logCapacity_) {
        logOverflowed_ = true;
        PATHLINK_LOG_WARN("interaction log overflowed at %u entries", logCapacity_);
        return;
    }
    InteractionLogEntry entry{};
    entry.type = static_cast<std::uint32_t>(type);
    entry.x = x;
    entry.y = y;
    logEntries_.push_back(entry);
}

bool InteractionSession::replayInteractionLog() {
    if (state_.isDrawing() || logEntries_.empty() || logOverflowed_) {
        return false;
    }

    const bool prevReplaying = replaying_;
    replaying_ = true;
    resetSession();

    bool ok = true;
    for (const auto& entry : logEntries_) {
        const Point2 p{entry.x, entry.y};
        switch (static_cast<InteractionLogEvent>(entry.type)) {
            case InteractionLogEvent::Down:
                beginPath(p);
                break;
            case InteractionLogEvent::Move:
                extendPath(p);
                break;
            case InteractionLogEvent::Up:
                endPath(p);
                break;
            case InteractionLogEvent::Cancel:
                cancelPath();
                break;
            case InteractionLogEvent::Reset:
                resetSession();
                break;
            default:
                PATHLINK_LOG_WARN("unknown interaction log entry type %u", entry.type);
                ok = false;
                break;
        }
        if (!ok) break;
    }

    replaying_ = prevReplaying;
    return ok;
}
