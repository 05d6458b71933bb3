#pragma once

#include <cstddef>
#include <cstdint>

// Watches the committed-path count and raises a single deferred win
// notification per session. The timer is a one-shot tagged with the session
// generation; reset() bumps the generation so a pending shot can never land
// in the next session.
class WinEvaluator {
public:
    WinEvaluator() = default;

    void configure(std::uint32_t categoryCount, double delayMs) noexcept;

    // Returns true when the count completes the board. Arms the timer on the
    // first completion of the current generation only.
    bool checkCompletion(std::size_t committedCount, double nowMs) noexcept;

    // Fires the armed timer once its deadline has passed. outGeneration
    // receives the token the shot was armed with.
    bool poll(double nowMs, std::uint32_t& outGeneration) noexcept;

    void reset() noexcept;

    std::uint32_t generation() const noexcept { return generation_; }
    bool isArmed() const noexcept { return armed_; }
    bool isComplete() const noexcept { return complete_; }
    bool hasNotified() const noexcept { return notified_; }
    double deadlineMs() const noexcept { return deadlineMs_; }

private:
    std::uint32_t categoryCount_{3};
    double delayMs_{300.0};

    std::uint32_t generation_{1};
    bool complete_{false};
    bool notified_{false};

    bool armed_{false};
    double deadlineMs_{0.0};
    std::uint32_t armedGeneration_{0};
};
