#pragma once

#include "keyboard_listener.h"
#include "log.h"

#include <array>
#include <atomic>
#include <string>
#include <thread>

typedef struct _XDisplay Display;

namespace bbd {

// Polls XQueryKeymap on a dedicated thread and reports keymap transitions as
// keysym names.
class X11KeyboardListener : public KeyboardListener {
public:
    static constexpr int kPollIntervalMs = 10;

    X11KeyboardListener();
    ~X11KeyboardListener() override;

    X11KeyboardListener(const X11KeyboardListener&) = delete;
    X11KeyboardListener& operator=(const X11KeyboardListener&) = delete;

    void SetLogger(LogFn logger);

    bool Start(KeyFn on_press, KeyFn on_release) override;
    void Stop() override;

private:
    void PollLoop();
    std::string KeyName(unsigned int keycode) const;
    void Log(LogLevel level, const std::string& msg) const;

    LogFn logger_;
    KeyFn on_press_;
    KeyFn on_release_;
    Display* display_ = nullptr;
    std::atomic<bool> running_{false};
    std::thread worker_;
    std::array<char, 32> previous_{};
};

} // namespace bbd
