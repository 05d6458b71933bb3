#include "pathlink/game/win_evaluator.h"
#include "pathlink/core/logging.h"

void WinEvaluator::configure(std::uint32_t categoryCount, double delayMs) noexcept {
    categoryCount_ = categoryCount;
    delayMs_ = delayMs;
}

bool WinEvaluator::checkCompletion(std::size_t committedCount, double nowMs) noexcept {
    if (committedCount != categoryCount_) {
        return false;
    }
    if (complete_) {
        return true;
    }
    complete_ = true;
    armed_ = true;
    armedGeneration_ = generation_;
    deadlineMs_ = nowMs + delayMs_;
    PATHLINK_LOG_DEBUG("win armed gen=%u deadline=%.1f", generation_, deadlineMs_);
    return true;
}

bool WinEvaluator::poll(double nowMs, std::uint32_t& outGeneration) noexcept {
    if (!armed_ || nowMs < deadlineMs_) {
        return false;
    }
    armed_ = false;
    if (armedGeneration_ != generation_) {
        PATHLINK_LOG_WARN("dropping stale win notification gen=%u (current %u)", armedGeneration_, generation_);
        return false;
    }
    notified_ = true;
    outGeneration = armedGeneration_;
    return true;
}

void WinEvaluator::reset() noexcept {
    ++generation_;
    complete_ = false;
    notified_ = false;
    armed_ = false;
    deadlineMs_ = 0.0;
}
