#pragma once

#include "shared_state.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>

namespace bbd {

// Display-only extrapolation of the server's elapsed time between bb-state
// pushes. Re-anchors whenever elapsedMs or running changes; never writes state.
class SessionClock {
public:
    using TimePoint = std::chrono::steady_clock::time_point;

    explicit SessionClock(SharedState& state);
    ~SessionClock();

    SessionClock(const SessionClock&) = delete;
    SessionClock& operator=(const SessionClock&) = delete;

    void Anchor(std::int64_t elapsed_ms, bool running, TimePoint at);

    std::int64_t ElapsedAt(TimePoint now) const;

    // Called once per engine tick.
    void Refresh(TimePoint now);
    std::int64_t DisplayElapsedMs() const { return display_ms_.load(); }

private:
    SharedState& state_;
    SharedState::SubscriptionId subscription_ = 0;

    mutable std::mutex mu_;
    std::int64_t base_ms_ = 0;
    bool running_ = false;
    TimePoint anchored_at_;

    std::atomic<std::int64_t> display_ms_{0};
};

} // namespace bbd
