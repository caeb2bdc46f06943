#pragma once

#include "action_queue.h"
#include "keyboard_listener.h"
#include "log.h"

#include <map>
#include <mutex>
#include <set>
#include <string>

namespace bbd {

using KeyCombo = std::set<std::string>;

// Canonical key identifier: lowercase, modifier aliases folded (cmd/super/meta
// and left/right variants become "ctrl", "shift", "alt").
std::string NormalizeKeyName(const std::string& raw);

// "Ctrl+Shift+D" -> {ctrl, shift, d}. Empty on a blank or malformed combo.
KeyCombo ParseKeyCombo(const std::string& text);
std::string FormatKeyCombo(const KeyCombo& combo);

// Matches the set of currently held keys against registered combos and posts
// the bound action onto the engine's ActionQueue. Key callbacks arrive on the
// listener thread; nothing here touches SharedState or the network.
class HotkeyRouter {
public:
    explicit HotkeyRouter(ActionQueue& actions);
    ~HotkeyRouter();

    HotkeyRouter(const HotkeyRouter&) = delete;
    HotkeyRouter& operator=(const HotkeyRouter&) = delete;

    void SetLogger(LogFn logger);

    // Replaces any existing binding for the same combo.
    bool Register(const std::string& combo, const EngineAction& action);
    bool Unregister(const std::string& combo);
    std::size_t BindingCount() const;

    bool Start(KeyboardListener& listener);
    void Stop();

    void OnKeyPressed(const std::string& raw_key);
    void OnKeyReleased(const std::string& raw_key);

private:
    void Log(LogLevel level, const std::string& msg) const;

    ActionQueue& actions_;
    LogFn logger_;

    mutable std::mutex mu_;
    std::map<KeyCombo, EngineAction> bindings_;
    // Physical keys held, by raw name, and the normalized set they form.
    std::set<std::string> held_raw_;
    std::map<std::string, int> held_counts_;
    KeyCombo held_;
    KeyboardListener* listener_ = nullptr;
};

} // namespace bbd
