#include "x11_keyboard_listener.h"

#include <X11/XKBlib.h>
#include <X11/Xlib.h>

#include <chrono>
#include <sstream>
#include <utility>

namespace bbd {

X11KeyboardListener::X11KeyboardListener() = default;

X11KeyboardListener::~X11KeyboardListener() {
    Stop();
}

void X11KeyboardListener::SetLogger(LogFn logger) {
    logger_ = std::move(logger);
}

bool X11KeyboardListener::Start(KeyFn on_press, KeyFn on_release) {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return true;
    }
    display_ = XOpenDisplay(nullptr);
    if (!display_) {
        running_.store(false);
        Log(LogLevel::Warning, "keyboard listener open failed; hotkeys disabled");
        return false;
    }
    on_press_ = std::move(on_press);
    on_release_ = std::move(on_release);
    XQueryKeymap(display_, previous_.data());
    worker_ = std::thread([this] { PollLoop(); });
    Log(LogLevel::Info, "keyboard listener started");
    return true;
}

void X11KeyboardListener::Stop() {
    bool expected = true;
    if (!running_.compare_exchange_strong(expected, false)) {
        return;
    }
    if (worker_.joinable()) {
        worker_.join();
    }
    if (display_) {
        XCloseDisplay(display_);
        display_ = nullptr;
    }
    Log(LogLevel::Info, "keyboard listener stopped");
}

void X11KeyboardListener::PollLoop() {
    std::array<char, 32> current{};
    while (running_.load()) {
        XQueryKeymap(display_, current.data());
        for (unsigned int byte = 0; byte < current.size(); ++byte) {
            const unsigned char changed = static_cast<unsigned char>(current[byte] ^ previous_[byte]);
            if (changed == 0) {
                continue;
            }
            for (unsigned int bit = 0; bit < 8; ++bit) {
                if ((changed & (1u << bit)) == 0) {
                    continue;
                }
                const unsigned int keycode = byte * 8 + bit;
                const std::string name = KeyName(keycode);
                if (name.empty()) {
                    continue;
                }
                const bool down = (static_cast<unsigned char>(current[byte]) & (1u << bit)) != 0;
                const KeyFn& fn = down ? on_press_ : on_release_;
                if (fn) {
                    fn(name);
                }
            }
        }
        previous_ = current;
        std::this_thread::sleep_for(std::chrono::milliseconds(kPollIntervalMs));
    }
}

std::string X11KeyboardListener::KeyName(unsigned int keycode) const {
    const KeySym sym = XkbKeycodeToKeysym(display_, static_cast<KeyCode>(keycode), 0, 0);
    if (sym == NoSymbol) {
        return std::string();
    }
    const char* name = XKeysymToString(sym);
    return name ? std::string(name) : std::string();
}

void X11KeyboardListener::Log(LogLevel level, const std::string& msg) const {
    if (logger_) {
        logger_(level, msg);
    }
}

} // namespace bbd
