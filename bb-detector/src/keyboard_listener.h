#pragma once

#include <functional>
#include <string>

namespace bbd {

// Global key event source. Callbacks run on the listener's own thread with the
// backend's raw key name.
class KeyboardListener {
public:
    using KeyFn = std::function<void(const std::string& key)>;

    virtual ~KeyboardListener() = default;
    virtual bool Start(KeyFn on_press, KeyFn on_release) = 0;
    virtual void Stop() = 0;
};

} // namespace bbd
