#include "event_gate.h"

#include <algorithm>

namespace bbd {

EventGate::EventGate(const FrameMatcher& matcher, const SharedState& state)
    : matcher_(matcher), state_(state) {}

void EventGate::SetCooldown(std::chrono::milliseconds cooldown) {
    cooldown_ = std::max(cooldown, std::chrono::milliseconds(0));
}

void EventGate::SetRequiredHits(int hits) {
    required_hits_ = std::max(1, hits);
    streak_ = 0;
}

bool EventGate::IsArmed() const {
    return state_.GetBool(Field::DetectionEnabled) && state_.GetBool(Field::Connected);
}

void EventGate::Reset() {
    streak_ = 0;
    last_event_.reset();
}

std::optional<DeathEvent> EventGate::Evaluate(const cv::Mat& frame, Clock::time_point now) {
    // One snapshot per evaluation: the gate and the boss tag see the same state.
    const SessionState snapshot = state_.Snapshot();
    if (!snapshot.detection_enabled || !snapshot.connected) {
        streak_ = 0;
        return std::nullopt;
    }

    const MatchResult match = matcher_.IsMatch(frame);
    if (!match.matched) {
        streak_ = 0;
        return std::nullopt;
    }
    if (++streak_ < required_hits_) {
        return std::nullopt;
    }
    if (last_event_ && now - *last_event_ < cooldown_) {
        return std::nullopt;
    }

    last_event_ = now;
    streak_ = 0;

    DeathEvent event;
    event.boss = snapshot.boss_mode;
    event.confidence = match.confidence;
    event.at = now;
    return event;
}

} // namespace bbd
