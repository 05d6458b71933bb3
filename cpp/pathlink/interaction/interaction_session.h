#pragma once

#include "pathlink/interaction/interaction_types.h"
#include "pathlink/interaction/path_validator.h"
#include "pathlink/protocol/protocol_types.h"

#include <cstdint>
#include <string>
#include <vector>

// Forward declarations
class PathLinkEngine; // Facade, owns event stream and clock
class TargetRegistry; // Hit testing
class WinEvaluator;   // Completion signal

// The Idle/Drawing state machine. Sole owner of the in-progress path and of
// the committed-path set; nothing else mutates them.
class InteractionSession {
public:
    InteractionSession(PathLinkEngine& engine, TargetRegistry& registry, WinEvaluator& winEvaluator);

    // ==============================================================================
    // State Query
    // ==============================================================================
    bool isDrawing() const noexcept { return state_.isDrawing(); }
    const SessionState& state() const noexcept { return state_; }
    RenderState getRenderState() const noexcept;

    InteractionOptions options;

    struct StrokeStats {
        std::uint32_t validations = 0;  // canExtend calls for the current stroke
        std::uint32_t droppedMoves = 0; // moves under the spacing threshold
        ExtendVerdict lastExtend = ExtendVerdict::Accepted;
        TerminateVerdict lastTerminate = TerminateVerdict::Accepted;
    };
    const StrokeStats& getStrokeStats() const noexcept { return strokeStats_; }

    // ==============================================================================
    // Stroke API (canonical pointer events)
    // ==============================================================================
    bool beginPath(const Point2& p);
    void extendPath(const Point2& p);
    bool endPath(const Point2& p);
    void cancelPath();
    void resetSession();

    // ==============================================================================
    // Interaction Logging / Replay
    // ==============================================================================
    void setInteractionLogEnabled(bool enabled, std::uint32_t maxEntries);
    void clearInteractionLog();
    bool replayInteractionLog();
    bool isInteractionLogOverflowed() const { return logOverflowed_; }
    const std::vector<pathlink::protocol::InteractionLogEntry>& getInteractionLogEntries() const { return logEntries_; }

private:
    PathLinkEngine& engine_;
    TargetRegistry& registry_;
    WinEvaluator& winEvaluator_;
    PathValidator validator_;

    SessionState state_;
    StrokeStats strokeStats_;

    bool logEnabled_ = false;
    bool logOverflowed_ = false;
    bool replaying_ = false;
    std::uint32_t logCapacity_ = 0;
    std::vector<pathlink::protocol::InteractionLogEntry> logEntries_;

    void discardCurrent(CancelReason reason, std::uint32_t detail);
    void evictPathsTouching(const std::string& targetId);
    void checkInvariants() const;

    void recordLogEntry(pathlink::protocol::InteractionLogEvent type, float x, float y);
};
