#include "action_queue.h"

namespace bbd {

EngineAction EngineAction::Of(Kind kind) {
    EngineAction action;
    action.kind = kind;
    return action;
}

EngineAction EngineAction::Send(const Command& command) {
    EngineAction action;
    action.kind = Kind::SendCommand;
    action.command = command;
    return action;
}

const char* EngineActionName(EngineAction::Kind kind) {
    switch (kind) {
    case EngineAction::Kind::ManualDeath:
        return "manual_death";
    case EngineAction::Kind::ToggleBoss:
        return "toggle_boss";
    case EngineAction::Kind::ToggleDetection:
        return "toggle_detection";
    case EngineAction::Kind::ToggleDisplayMode:
        return "toggle_display_mode";
    case EngineAction::Kind::SendCommand:
        return "send_command";
    }
    return "unknown";
}

void ActionQueue::Post(const EngineAction& action) {
    std::lock_guard<std::mutex> lock(mu_);
    pending_.push_back(action);
}

std::vector<EngineAction> ActionQueue::Drain() {
    std::vector<EngineAction> out;
    std::lock_guard<std::mutex> lock(mu_);
    out.swap(pending_);
    return out;
}

std::size_t ActionQueue::Size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return pending_.size();
}

} // namespace bbd
