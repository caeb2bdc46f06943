#include "session_clock.h"

namespace bbd {

SessionClock::SessionClock(SharedState& state) : state_(state) {
    Anchor(state_.GetInt(Field::ElapsedMs), state_.GetBool(Field::Running), std::chrono::steady_clock::now());
    subscription_ = state_.Subscribe([this](Field field, const StateValue&) {
        if (field != Field::ElapsedMs && field != Field::Running) {
            return;
        }
        Anchor(state_.GetInt(Field::ElapsedMs), state_.GetBool(Field::Running), std::chrono::steady_clock::now());
    });
}

SessionClock::~SessionClock() {
    state_.Unsubscribe(subscription_);
}

void SessionClock::Anchor(std::int64_t elapsed_ms, bool running, TimePoint at) {
    {
        std::lock_guard<std::mutex> lock(mu_);
        base_ms_ = elapsed_ms;
        running_ = running;
        anchored_at_ = at;
    }
    display_ms_.store(elapsed_ms);
}

std::int64_t SessionClock::ElapsedAt(TimePoint now) const {
    std::lock_guard<std::mutex> lock(mu_);
    if (!running_ || now <= anchored_at_) {
        return base_ms_;
    }
    return base_ms_ + std::chrono::duration_cast<std::chrono::milliseconds>(now - anchored_at_).count();
}

void SessionClock::Refresh(TimePoint now) {
    display_ms_.store(ElapsedAt(now));
}

} // namespace bbd
