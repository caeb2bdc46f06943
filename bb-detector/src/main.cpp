#include "config.h"
#include "detector_runtime.h"
#include "log.h"
#include "x11_frame_source.h"
#include "x11_keyboard_listener.h"

#include <QtCore/QCommandLineOption>
#include <QtCore/QCommandLineParser>
#include <QtCore/QCoreApplication>
#include <QtCore/QMetaObject>
#include <QtCore/QTimer>

#include <atomic>
#include <csignal>
#include <memory>
#include <string>
#include <utility>

namespace {

std::atomic<bool> g_quit_requested{false};

void OnQuitSignal(int) {
    g_quit_requested.store(true);
}

} // namespace

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("bb-detector"));
    QCoreApplication::setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Death detection and session sync engine"));
    parser.addHelpOption();
    parser.addVersionOption();
    const QCommandLineOption config_opt(QStringLiteral("config"), QStringLiteral("Config file."), QStringLiteral("file"));
    const QCommandLineOption profile_opt(QStringLiteral("profile"), QStringLiteral("Profile name."), QStringLiteral("name"));
    const QCommandLineOption password_opt(QStringLiteral("password"), QStringLiteral("Profile password."), QStringLiteral("pw"));
    const QCommandLineOption template_opt(QStringLiteral("template"), QStringLiteral("Death template image."), QStringLiteral("png"));
    const QCommandLineOption no_hotkeys_opt(QStringLiteral("no-hotkeys"), QStringLiteral("Disable global hotkeys."));
    parser.addOption(config_opt);
    parser.addOption(profile_opt);
    parser.addOption(password_opt);
    parser.addOption(template_opt);
    parser.addOption(no_hotkeys_opt);
    parser.process(app);

    const bbd::LogFn log = bbd::MakeQtLogger("main");

    bbd::Config config(parser.isSet(config_opt) ? parser.value(config_opt).toStdString() : bbd::Config::DefaultPath());
    if (!config.Load()) {
        log(bbd::LogLevel::Info, "config not loaded path=" + config.Path() + "; using defaults");
    }
    if (parser.isSet(profile_opt)) {
        config.Set("profile.name", parser.value(profile_opt));
    }
    if (parser.isSet(password_opt)) {
        config.Set("profile.password", parser.value(password_opt));
    }
    if (parser.isSet(template_opt)) {
        config.Set("templates.death.custom", parser.value(template_opt));
    }

    auto frames = std::make_unique<bbd::X11FrameSource>();
    frames->SetLogger(bbd::MakeQtLogger("capture"));
    if (!frames->Open()) {
        log(bbd::LogLevel::Warning, "no X display; detection stays idle");
    }

    bbd::DetectorRuntime::Backends backends;
    backends.frames = std::move(frames);
    if (!parser.isSet(no_hotkeys_opt)) {
        auto keyboard = std::make_unique<bbd::X11KeyboardListener>();
        keyboard->SetLogger(bbd::MakeQtLogger("keyboard"));
        backends.keyboard = std::move(keyboard);
    }

    bbd::DetectorRuntime runtime(config, std::move(backends));

    bbd::SyncClient::Callbacks callbacks{};
    callbacks.on_auth_result = [log](bool success, const std::string& error) {
        if (!success) {
            log(bbd::LogLevel::Warning, "authentication rejected error=" + error);
        }
    };
    callbacks.on_connection_state = [log](bbd::SyncClient::ConnectionState state) {
        log(bbd::LogLevel::Info, std::string("connection state=") + bbd::ConnectionStateName(state));
    };
    runtime.SetSyncCallbacks(std::move(callbacks));
    runtime.SetDisplayModeCallback([log] { log(bbd::LogLevel::Info, "display mode toggle requested"); });

    // Stand-in observer: state changes are reported from the main thread.
    QCoreApplication* app_ptr = &app;
    const auto subscription = runtime.State().Subscribe([app_ptr, log](bbd::Field field, const bbd::StateValue& value) {
        const std::string line = std::string(bbd::FieldName(field)) + "=" + bbd::DescribeValue(value);
        QMetaObject::invokeMethod(
            app_ptr, [log, line] { log(bbd::LogLevel::Info, "state " + line); }, Qt::QueuedConnection);
    });
    runtime.State().SetListenerErrorHook([log](bbd::Field field, const std::string& what) {
        log(bbd::LogLevel::Warning, std::string("state listener failed field=") + bbd::FieldName(field) + " error=" + what);
    });

    std::signal(SIGINT, OnQuitSignal);
    std::signal(SIGTERM, OnQuitSignal);
    QTimer quit_poll;
    QObject::connect(&quit_poll, &QTimer::timeout, &app, [] {
        if (g_quit_requested.load()) {
            QCoreApplication::quit();
        }
    });
    quit_poll.start(100);

    runtime.Start();
    const int rc = app.exec();

    log(bbd::LogLevel::Info, "shutting down");
    runtime.Stop();
    runtime.State().Unsubscribe(subscription);
    return rc;
}
