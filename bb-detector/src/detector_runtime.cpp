#include "detector_runtime.h"

#include "websocket_transport.h"

#include <QtCore/QJsonValue>
#include <QtCore/QString>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <utility>

namespace {

std::unique_ptr<bbd::FrameSource> RequireFrames(std::unique_ptr<bbd::FrameSource> frames) {
    if (!frames) {
        throw std::invalid_argument("DetectorRuntime requires a frame source");
    }
    return frames;
}

bbd::SyncClient::TransportFactory OrDefaultTransport(bbd::SyncClient::TransportFactory factory) {
    if (factory) {
        return factory;
    }
    return []() -> std::unique_ptr<bbd::Transport> { return std::make_unique<bbd::WebSocketTransport>(); };
}

QJsonValue TextOrNull(const std::string& text) {
    return text.empty() ? QJsonValue(QJsonValue::Null) : QJsonValue(QString::fromStdString(text));
}

} // namespace

namespace bbd {

DetectorRuntime::DetectorRuntime(Config& config, Backends backends)
    : config_(config),
      gate_(matcher_, state_),
      clock_(state_),
      sync_(state_, OrDefaultTransport(std::move(backends.transport_factory))),
      frames_(RequireFrames(std::move(backends.frames))),
      engine_(*frames_, gate_, sync_, state_, actions_, &clock_),
      keyboard_(std::move(backends.keyboard)),
      hotkeys_(actions_) {
    logger_ = MakeQtLogger("runtime");
    sync_.SetLogger(MakeQtLogger("sync"));
    engine_.SetLogger(MakeQtLogger("engine"));
    hotkeys_.SetLogger(MakeQtLogger("hotkeys"));
}

DetectorRuntime::~DetectorRuntime() {
    Stop();
}

void DetectorRuntime::SetLogger(LogFn logger) {
    logger_ = TagLogger(logger, "runtime");
    sync_.SetLogger(TagLogger(logger, "sync"));
    engine_.SetLogger(TagLogger(logger, "engine"));
    hotkeys_.SetLogger(TagLogger(logger, "hotkeys"));
}

void DetectorRuntime::SetSyncCallbacks(SyncClient::Callbacks callbacks) {
    sync_.SetCallbacks(std::move(callbacks));
}

void DetectorRuntime::SetDisplayModeCallback(EngineLoop::DisplayModeFn fn) {
    engine_.SetDisplayModeCallback(std::move(fn));
}

bool DetectorRuntime::Start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return true;
    }
    Log(LogLevel::Info, "runtime start config=" + config_.Path());

    ApplyDetectionSettings();

    if (keyboard_) {
        RegisterHotkeys();
        if (!hotkeys_.Start(*keyboard_)) {
            Log(LogLevel::Warning, "hotkey listener unavailable; manual triggers disabled");
        }
    }

    engine_.Start();

    const std::string profile = config_.GetString("profile.name", std::string());
    if (profile.empty()) {
        Log(LogLevel::Info, "no profile configured; staying offline");
    } else if (config_.GetBool("profile.auto_connect", true)) {
        ConnectSync();
    }
    return true;
}

void DetectorRuntime::Stop() {
    bool expected = true;
    if (!running_.compare_exchange_strong(expected, false)) {
        return;
    }
    hotkeys_.Stop();
    engine_.Stop();
    sync_.Disconnect();
    Log(LogLevel::Info, "runtime stopped");
}

bool DetectorRuntime::IsRunning() const {
    return running_.load();
}

void DetectorRuntime::SelectProfile(const std::string& name, const std::string& password) {
    config_.Set("profile.name", TextOrNull(name));
    config_.Set("profile.password", TextOrNull(password));
    SaveConfig();

    sync_.Disconnect();
    if (name.empty()) {
        Log(LogLevel::Info, "profile cleared; staying offline");
        return;
    }
    Log(LogLevel::Info, "profile selected name=" + name);
    if (running_.load()) {
        ConnectSync();
    }
}

bool DetectorRuntime::ChangeTemplate(const std::string& path) {
    config_.Set("templates.death.custom", TextOrNull(path));
    SaveConfig();
    const DetectionSettings settings = LoadDetectionSettings(config_, TagLogger(logger_, "config"));
    if (!matcher_.ReloadFromFile(settings.template_path, settings.threshold)) {
        Log(LogLevel::Warning, "template load failed path=" + settings.template_path);
        return false;
    }
    Log(LogLevel::Info, "template loaded path=" + settings.template_path);
    return true;
}

MatchResult DetectorRuntime::TestDetection(const cv::Mat& frame) const {
    return matcher_.IsMatch(frame);
}

void DetectorRuntime::Post(const EngineAction& action) {
    actions_.Post(action);
}

void DetectorRuntime::ApplyDetectionSettings() {
    const DetectionSettings settings = LoadDetectionSettings(config_, TagLogger(logger_, "config"));

    if (matcher_.ReloadFromFile(settings.template_path, settings.threshold)) {
        Log(LogLevel::Info, "template loaded path=" + settings.template_path);
    } else {
        Log(LogLevel::Warning, "template load failed path=" + settings.template_path + "; detection idle");
    }

    gate_.SetCooldown(std::chrono::seconds(settings.cooldown_seconds));
    gate_.SetRequiredHits(settings.consecutive_hits);

    EngineLoop::Options options;
    options.fps = settings.fps;
    if (settings.region) {
        options.use_region = true;
        options.region_x = settings.region->x;
        options.region_y = settings.region->y;
        options.region_width = settings.region->width;
        options.region_height = settings.region->height;
    }
    engine_.SetOptions(options);
}

void DetectorRuntime::RegisterHotkeys() {
    struct Binding {
        const char* key;
        const char* fallback;
        EngineAction::Kind kind;
    };
    static const Binding kBindings[] = {
        {"hotkeys.manual_death", "ctrl+shift+d", EngineAction::Kind::ManualDeath},
        {"hotkeys.toggle_boss", "ctrl+shift+b", EngineAction::Kind::ToggleBoss},
        {"hotkeys.toggle_detection", "ctrl+shift+p", EngineAction::Kind::ToggleDetection},
        {"hotkeys.show_overlay", "ctrl+shift+o", EngineAction::Kind::ToggleDisplayMode},
    };
    for (const auto& binding : kBindings) {
        hotkeys_.Register(config_.GetString(binding.key, binding.fallback), EngineAction::Of(binding.kind));
    }
}

void DetectorRuntime::ConnectSync() {
    SyncClient::Options options;
    options.endpoint = config_.GetString("connection.endpoint", options.endpoint);
    options.profile = config_.GetString("profile.name", std::string());
    options.password = config_.GetString("profile.password", std::string());
    options.reconnect_delay_ms = config_.GetInt("connection.reconnect_delay_ms", options.reconnect_delay_ms);
    options.max_reconnect_delay_ms =
        config_.GetInt("connection.max_reconnect_delay_ms", options.max_reconnect_delay_ms);
    sync_.SetOptions(options);
    sync_.Connect();
}

void DetectorRuntime::SaveConfig() {
    if (!config_.Save()) {
        Log(LogLevel::Warning, "config save failed path=" + config_.Path());
    }
}

void DetectorRuntime::Log(LogLevel level, const std::string& msg) const {
    if (logger_) {
        logger_(level, msg);
    }
}

} // namespace bbd
