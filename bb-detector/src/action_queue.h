#pragma once

#include "protocol.h"

#include <cstddef>
#include <mutex>
#include <vector>

namespace bbd {

struct EngineAction {
    enum class Kind {
        ManualDeath,
        ToggleBoss,
        ToggleDetection,
        ToggleDisplayMode,
        SendCommand,
    };

    Kind kind = Kind::ManualDeath;
    Command command;  // SendCommand only

    static EngineAction Of(Kind kind);
    static EngineAction Send(const Command& command);
};

const char* EngineActionName(EngineAction::Kind kind);

// Multi-producer hand-off into the tick loop. Post() from any thread; the tick
// loop takes everything queued so far with Drain().
class ActionQueue {
public:
    void Post(const EngineAction& action);
    std::vector<EngineAction> Drain();
    std::size_t Size() const;

private:
    mutable std::mutex mu_;
    std::vector<EngineAction> pending_;
};

} // namespace bbd
