#include "engine_loop.h"

#include <exception>
#include <sstream>
#include <utility>

namespace {
constexpr auto kOverrunLogInterval = std::chrono::seconds(1);
}

namespace bbd {

EngineLoop::EngineLoop(FrameSource& frames,
                       EventGate& gate,
                       CommandSink& sink,
                       SharedState& state,
                       ActionQueue& actions,
                       SessionClock* clock)
    : frames_(frames), gate_(gate), sink_(sink), state_(state), actions_(actions), clock_(clock) {}

EngineLoop::~EngineLoop() {
    Stop();
}

void EngineLoop::SetOptions(const Options& options) {
    options_ = options;
    if (options_.fps <= 0) {
        options_.fps = kDefaultFps;
    }
}

void EngineLoop::SetLogger(LogFn logger) {
    logger_ = std::move(logger);
}

void EngineLoop::SetDisplayModeCallback(DisplayModeFn fn) {
    on_display_mode_ = std::move(fn);
}

bool EngineLoop::Start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(mu_);
        stop_requested_ = false;
    }
    worker_ = std::thread([this] { Run(); });
    std::ostringstream oss;
    oss << "engine started fps=" << options_.fps;
    Log(LogLevel::Info, oss.str());
    return true;
}

void EngineLoop::Stop() {
    bool expected = true;
    if (!running_.compare_exchange_strong(expected, false)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mu_);
        stop_requested_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    std::ostringstream oss;
    oss << "engine stopped ticks=" << tick_count_.load() << " overruns=" << overrun_count_.load()
        << " events=" << event_count_.load();
    Log(LogLevel::Info, oss.str());
}

bool EngineLoop::IsRunning() const {
    return running_.load();
}

void EngineLoop::Run() {
    const auto interval = std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(1000)) / options_.fps;
    auto next = Clock::now();

    std::unique_lock<std::mutex> lock(mu_);
    while (!stop_requested_) {
        lock.unlock();
        try {
            Tick(Clock::now());
        } catch (const std::exception& e) {
            Log(LogLevel::Warning, std::string("tick failed error=") + e.what());
        }
        lock.lock();

        next += interval;
        const auto now = Clock::now();
        if (now >= next) {
            // Behind schedule: start the next tick right away and rebase.
            NoteOverrun(now - next, now);
            next = now;
            continue;
        }
        cv_.wait_until(lock, next, [this] { return stop_requested_; });
    }
}

void EngineLoop::Tick(Clock::time_point now) {
    tick_count_.fetch_add(1);
    DispatchActions();
    if (clock_) {
        clock_->Refresh(now);
    }
    if (!gate_.IsArmed()) {
        return;
    }

    const cv::Mat frame = options_.use_region
                              ? frames_.GrabRegion(options_.region_x, options_.region_y,
                                                   options_.region_width, options_.region_height)
                              : frames_.Grab();
    if (frame.empty()) {
        return;
    }

    const std::optional<DeathEvent> event = gate_.Evaluate(frame, now);
    if (event) {
        HandleEvent(*event);
    }
}

void EngineLoop::DispatchActions() {
    for (const auto& action : actions_.Drain()) {
        HandleAction(action);
    }
}

void EngineLoop::HandleAction(const EngineAction& action) {
    switch (action.kind) {
    case EngineAction::Kind::ManualDeath: {
        const SessionState snapshot = state_.Snapshot();
        if (!snapshot.connected) {
            Log(LogLevel::Debug, "manual death ignored reason=not_connected");
            return;
        }
        sink_.Submit(Command::Of(snapshot.boss_mode ? CommandType::BossDeath : CommandType::Death));
        Log(LogLevel::Info, std::string("manual death boss=") + (snapshot.boss_mode ? "true" : "false"));
        return;
    }
    case EngineAction::Kind::ToggleBoss: {
        const bool boss_mode = state_.GetBool(Field::BossMode);
        sink_.Submit(Command::Of(boss_mode ? CommandType::BossCancel : CommandType::BossStart));
        return;
    }
    case EngineAction::Kind::ToggleDetection: {
        const bool enabled = !state_.GetBool(Field::DetectionEnabled);
        state_.Set(Field::DetectionEnabled, enabled);
        Log(LogLevel::Info, std::string("detection ") + (enabled ? "enabled" : "paused"));
        return;
    }
    case EngineAction::Kind::ToggleDisplayMode:
        if (on_display_mode_) {
            on_display_mode_();
        }
        return;
    case EngineAction::Kind::SendCommand:
        sink_.Submit(action.command);
        return;
    }
}

void EngineLoop::HandleEvent(const DeathEvent& event) {
    event_count_.fetch_add(1);
    const bool sent = sink_.Submit(Command::Of(event.boss ? CommandType::BossDeath : CommandType::Death));
    std::ostringstream oss;
    oss << "death detected boss=" << (event.boss ? "true" : "false") << " confidence=" << event.confidence
        << " sent=" << (sent ? "true" : "false");
    Log(LogLevel::Info, oss.str());
}

void EngineLoop::NoteOverrun(Clock::duration late, Clock::time_point now) {
    const std::uint64_t total = overrun_count_.fetch_add(1) + 1;
    if (last_overrun_log_ != Clock::time_point{} && now - last_overrun_log_ < kOverrunLogInterval) {
        return;
    }
    last_overrun_log_ = now;
    std::ostringstream oss;
    oss << "tick overrun late_ms=" << std::chrono::duration_cast<std::chrono::milliseconds>(late).count()
        << " total=" << total;
    Log(LogLevel::Debug, oss.str());
}

void EngineLoop::Log(LogLevel level, const std::string& msg) const {
    if (logger_) {
        logger_(level, msg);
    }
}

} // namespace bbd
