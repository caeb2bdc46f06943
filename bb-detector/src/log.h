#pragma once

#include <functional>
#include <string>

namespace bbd {

enum class LogLevel {
    Debug,
    Info,
    Warning,
};

using LogFn = std::function<void(LogLevel level, const std::string& msg)>;

// Forwards to the "bbd" Qt logging category as "[component] msg".
LogFn MakeQtLogger(const std::string& component);

// Wraps logger so every message is prefixed with "[component] ".
LogFn TagLogger(const LogFn& logger, const std::string& component);

} // namespace bbd
