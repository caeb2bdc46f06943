#pragma once

#include "protocol.h"

namespace bbd {

// Single outbound command channel. Submit may be called from any thread and
// returns false when the command was dropped.
class CommandSink {
public:
    virtual ~CommandSink() = default;
    virtual bool Submit(const Command& command) = 0;
};

} // namespace bbd
