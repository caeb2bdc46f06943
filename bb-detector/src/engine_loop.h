#pragma once

#include "action_queue.h"
#include "command_sink.h"
#include "event_gate.h"
#include "frame_source.h"
#include "log.h"
#include "session_clock.h"
#include "shared_state.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

namespace bbd {

// Fixed-cadence tick loop: drain queued actions, capture, evaluate, and turn a
// DeathEvent into exactly one outbound command.
class EngineLoop {
public:
    static constexpr int kDefaultFps = 10;

    struct Options {
        int fps = kDefaultFps;
        bool use_region = false;
        int region_x = 0;
        int region_y = 0;
        int region_width = 0;
        int region_height = 0;
    };

    using DisplayModeFn = std::function<void()>;

    EngineLoop(FrameSource& frames,
               EventGate& gate,
               CommandSink& sink,
               SharedState& state,
               ActionQueue& actions,
               SessionClock* clock = nullptr);
    ~EngineLoop();

    EngineLoop(const EngineLoop&) = delete;
    EngineLoop& operator=(const EngineLoop&) = delete;

    void SetOptions(const Options& options);
    void SetLogger(LogFn logger);
    void SetDisplayModeCallback(DisplayModeFn fn);

    bool Start();
    // Lets the tick in progress finish; no new tick starts afterwards.
    void Stop();
    bool IsRunning() const;

    // One iteration of the loop body. Public so it can be driven directly.
    void Tick(Clock::time_point now);

    std::uint64_t TickCount() const { return tick_count_.load(); }
    std::uint64_t OverrunCount() const { return overrun_count_.load(); }
    std::uint64_t EventCount() const { return event_count_.load(); }

private:
    void Run();
    void DispatchActions();
    void HandleAction(const EngineAction& action);
    void HandleEvent(const DeathEvent& event);
    void NoteOverrun(Clock::duration late, Clock::time_point now);
    void Log(LogLevel level, const std::string& msg) const;

    FrameSource& frames_;
    EventGate& gate_;
    CommandSink& sink_;
    SharedState& state_;
    ActionQueue& actions_;
    SessionClock* clock_;

    Options options_;
    LogFn logger_;
    DisplayModeFn on_display_mode_;

    std::atomic<bool> running_{false};
    std::mutex mu_;
    std::condition_variable cv_;
    bool stop_requested_ = false;
    std::thread worker_;

    std::atomic<std::uint64_t> tick_count_{0};
    std::atomic<std::uint64_t> overrun_count_{0};
    std::atomic<std::uint64_t> event_count_{0};
    Clock::time_point last_overrun_log_{};
};

} // namespace bbd
