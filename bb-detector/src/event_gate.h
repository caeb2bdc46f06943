#pragma once

#include "shared_state.h"
#include "template_matcher.h"

#include <opencv2/core.hpp>

#include <chrono>
#include <optional>

namespace bbd {

using Clock = std::chrono::steady_clock;

struct DeathEvent {
    bool boss = false;
    double confidence = 0.0;
    Clock::time_point at;
};

// Turns per-tick match results into at most one DeathEvent per cooldown window.
// Evaluate() is called from the tick loop only.
class EventGate {
public:
    static constexpr int kDefaultCooldownMs = 5000;

    EventGate(const FrameMatcher& matcher, const SharedState& state);

    void SetCooldown(std::chrono::milliseconds cooldown);
    std::chrono::milliseconds Cooldown() const { return cooldown_; }

    // Consecutive matched evaluations needed before an event qualifies.
    void SetRequiredHits(int hits);
    int RequiredHits() const { return required_hits_; }

    // Policy gate: detection enabled and connected.
    bool IsArmed() const;

    void Reset();

    std::optional<DeathEvent> Evaluate(const cv::Mat& frame, Clock::time_point now);

private:
    const FrameMatcher& matcher_;
    const SharedState& state_;

    std::chrono::milliseconds cooldown_{kDefaultCooldownMs};
    int required_hits_ = 1;
    int streak_ = 0;
    std::optional<Clock::time_point> last_event_;
};

} // namespace bbd
