#include "hotkey_router.h"

#include <algorithm>
#include <cctype>
#include <map>
#include <utility>

namespace {

std::string ToLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string Trim(const std::string& text) {
    const auto begin = text.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return std::string();
    }
    const auto end = text.find_last_not_of(" \t");
    return text.substr(begin, end - begin + 1);
}

const std::map<std::string, std::string>& Aliases() {
    static const std::map<std::string, std::string> aliases = {
        {"control", "ctrl"},   {"control_l", "ctrl"}, {"control_r", "ctrl"},
        {"ctrl_l", "ctrl"},    {"ctrl_r", "ctrl"},    {"cmd", "ctrl"},
        {"cmd_l", "ctrl"},     {"cmd_r", "ctrl"},     {"command", "ctrl"},
        {"super", "ctrl"},     {"super_l", "ctrl"},   {"super_r", "ctrl"},
        {"meta", "ctrl"},      {"meta_l", "ctrl"},    {"meta_r", "ctrl"},
        {"win", "ctrl"},       {"shift_l", "shift"},  {"shift_r", "shift"},
        {"alt_l", "alt"},      {"alt_r", "alt"},      {"alt_gr", "alt"},
        {"altgr", "alt"},      {"option", "alt"},     {"iso_level3_shift", "alt"},
        {"mode_switch", "alt"}, {"return", "enter"},  {"kp_enter", "enter"},
        {"escape", "esc"},
    };
    return aliases;
}

} // namespace

namespace bbd {

std::string NormalizeKeyName(const std::string& raw) {
    if (raw == " ") {
        return "space";
    }
    const std::string key = ToLower(Trim(raw));
    const auto& aliases = Aliases();
    const auto it = aliases.find(key);
    return it != aliases.end() ? it->second : key;
}

KeyCombo ParseKeyCombo(const std::string& text) {
    KeyCombo combo;
    std::size_t start = 0;
    while (start <= text.size()) {
        const std::size_t plus = text.find('+', start);
        const std::string part = text.substr(start, plus == std::string::npos ? std::string::npos : plus - start);
        const std::string key = NormalizeKeyName(part);
        if (key.empty()) {
            return KeyCombo();
        }
        combo.insert(key);
        if (plus == std::string::npos) {
            break;
        }
        start = plus + 1;
    }
    return combo;
}

std::string FormatKeyCombo(const KeyCombo& combo) {
    std::string out;
    for (const auto& key : combo) {
        if (!out.empty()) {
            out += '+';
        }
        out += key;
    }
    return out;
}

HotkeyRouter::HotkeyRouter(ActionQueue& actions) : actions_(actions) {}

HotkeyRouter::~HotkeyRouter() {
    Stop();
}

void HotkeyRouter::SetLogger(LogFn logger) {
    logger_ = std::move(logger);
}

bool HotkeyRouter::Register(const std::string& combo, const EngineAction& action) {
    const KeyCombo keys = ParseKeyCombo(combo);
    if (keys.empty()) {
        Log(LogLevel::Warning, "hotkey ignored combo=" + combo);
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(mu_);
        bindings_[keys] = action;
    }
    Log(LogLevel::Info, "hotkey registered combo=" + FormatKeyCombo(keys) +
                            " action=" + EngineActionName(action.kind));
    return true;
}

bool HotkeyRouter::Unregister(const std::string& combo) {
    const KeyCombo keys = ParseKeyCombo(combo);
    std::lock_guard<std::mutex> lock(mu_);
    return bindings_.erase(keys) > 0;
}

std::size_t HotkeyRouter::BindingCount() const {
    std::lock_guard<std::mutex> lock(mu_);
    return bindings_.size();
}

bool HotkeyRouter::Start(KeyboardListener& listener) {
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (listener_) {
            return true;
        }
        held_raw_.clear();
        held_counts_.clear();
        held_.clear();
    }
    const bool started = listener.Start(
        [this](const std::string& key) { OnKeyPressed(key); },
        [this](const std::string& key) { OnKeyReleased(key); });
    if (!started) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mu_);
    listener_ = &listener;
    return true;
}

void HotkeyRouter::Stop() {
    KeyboardListener* listener = nullptr;
    {
        std::lock_guard<std::mutex> lock(mu_);
        listener = listener_;
        listener_ = nullptr;
    }
    // Outside the lock: the listener thread may be inside OnKeyPressed.
    if (listener) {
        listener->Stop();
    }
    std::lock_guard<std::mutex> lock(mu_);
    held_raw_.clear();
    held_counts_.clear();
    held_.clear();
}

void HotkeyRouter::OnKeyPressed(const std::string& raw_key) {
    const std::string key = NormalizeKeyName(raw_key);
    if (key.empty()) {
        return;
    }
    EngineAction action;
    {
        std::lock_guard<std::mutex> lock(mu_);
        // Auto-repeat re-reports a held key; only the transition counts.
        if (!held_raw_.insert(raw_key).second) {
            return;
        }
        // A second physical key with the same name (both Ctrl keys) changes nothing.
        if (++held_counts_[key] > 1) {
            return;
        }
        held_.insert(key);
        const auto it = bindings_.find(held_);
        if (it == bindings_.end()) {
            return;
        }
        action = it->second;
    }
    actions_.Post(action);
    Log(LogLevel::Debug, std::string("hotkey fired action=") + EngineActionName(action.kind));
}

void HotkeyRouter::OnKeyReleased(const std::string& raw_key) {
    const std::string key = NormalizeKeyName(raw_key);
    std::lock_guard<std::mutex> lock(mu_);
    if (held_raw_.erase(raw_key) == 0) {
        return;
    }
    const auto it = held_counts_.find(key);
    if (it == held_counts_.end() || --it->second > 0) {
        return;
    }
    held_counts_.erase(it);
    held_.erase(key);
}

void HotkeyRouter::Log(LogLevel level, const std::string& msg) const {
    if (logger_) {
        logger_(level, msg);
    }
}

} // namespace bbd
