#pragma once

#include "action_queue.h"
#include "config.h"
#include "engine_loop.h"
#include "event_gate.h"
#include "frame_source.h"
#include "hotkey_router.h"
#include "keyboard_listener.h"
#include "log.h"
#include "session_clock.h"
#include "shared_state.h"
#include "sync_client.h"
#include "template_matcher.h"

#include <atomic>
#include <memory>
#include <string>

namespace bbd {

// Owns and wires the engine components from a Config.
class DetectorRuntime {
public:
    struct Backends {
        std::unique_ptr<FrameSource> frames;         // required
        std::unique_ptr<KeyboardListener> keyboard;  // null disables hotkeys
        SyncClient::TransportFactory transport_factory;  // empty selects WebSocketTransport
    };

    DetectorRuntime(Config& config, Backends backends);
    ~DetectorRuntime();

    DetectorRuntime(const DetectorRuntime&) = delete;
    DetectorRuntime& operator=(const DetectorRuntime&) = delete;

    // Set before Start(); components read their loggers and callbacks from
    // their own threads.
    void SetLogger(LogFn logger);
    void SetSyncCallbacks(SyncClient::Callbacks callbacks);
    void SetDisplayModeCallback(EngineLoop::DisplayModeFn fn);

    bool Start();
    void Stop();
    bool IsRunning() const;

    void SelectProfile(const std::string& name, const std::string& password);
    bool ChangeTemplate(const std::string& path);
    MatchResult TestDetection(const cv::Mat& frame) const;
    void Post(const EngineAction& action);

    SharedState& State() { return state_; }
    const SessionClock& Clock() const { return clock_; }
    const TemplateMatcher& Matcher() const { return matcher_; }
    SyncClient& Sync() { return sync_; }
    const EngineLoop& Engine() const { return engine_; }

private:
    void ApplyDetectionSettings();
    void RegisterHotkeys();
    void ConnectSync();
    void SaveConfig();
    void Log(LogLevel level, const std::string& msg) const;

    Config& config_;
    LogFn logger_;
    std::atomic<bool> running_{false};

    SharedState state_;
    ActionQueue actions_;
    TemplateMatcher matcher_;
    EventGate gate_;
    SessionClock clock_;
    SyncClient sync_;
    std::unique_ptr<FrameSource> frames_;
    EngineLoop engine_;
    std::unique_ptr<KeyboardListener> keyboard_;
    HotkeyRouter hotkeys_;
};

} // namespace bbd
