#pragma once

#include "shared_state.h"

#include <cstdint>
#include <string>

namespace bbd {

enum class CommandType {
    Death,
    BossDeath,
    BossStart,
    BossPause,
    BossResume,
    BossVictory,
    BossCancel,
    StartTimer,
    StopTimer,
    ResetTimer,
    SetTime,
    SetDeaths,
    MilestoneAdd,
    MilestoneEdit,
    MilestoneDelete,
};

// Outbound mutating command. Only the members the type uses are encoded.
struct Command {
    CommandType type = CommandType::Death;
    std::string name;          // BossVictory, MilestoneAdd/Edit
    std::string id;            // MilestoneEdit/Delete
    std::string icon;          // MilestoneAdd/Edit
    std::int64_t value = 0;    // SetTime (ms), SetDeaths, MilestoneEdit timestamp
    bool has_value = false;    // MilestoneEdit timestamp is optional

    static Command Of(CommandType type);
    static Command BossVictory(const std::string& boss_name);
    static Command SetTime(std::int64_t elapsed_ms);
    static Command SetDeaths(std::int64_t deaths);
    static Command MilestoneAdd(const std::string& name, const std::string& icon);
    static Command MilestoneEdit(const std::string& id,
                                 const std::string& name,
                                 const std::string& icon,
                                 bool has_timestamp,
                                 std::int64_t timestamp);
    static Command MilestoneDelete(const std::string& id);
};

const char* CommandWireType(CommandType type);
std::string EncodeCommand(const Command& command);
std::string EncodeAuth(const std::string& password);

// Fields of a bb-state push; has_* marks presence in the message.
struct StateSnapshot {
    bool has_deaths = false;
    std::int64_t deaths = 0;
    bool has_elapsed = false;
    std::int64_t elapsed = 0;
    bool has_is_running = false;
    bool is_running = false;
    bool has_boss_fight_mode = false;
    bool boss_fight_mode = false;
    bool has_boss_deaths = false;
    std::int64_t boss_deaths = 0;
    bool has_boss_paused = false;
    bool boss_paused = false;
    bool has_can_edit = false;
    bool can_edit = false;
    bool has_profile_name = false;
    std::string profile_name;
    bool has_display_name = false;
    std::string display_name;
};

struct InboundMessage {
    enum class Kind {
        Invalid,
        State,
        AuthResult,
        Error,
        Other,
    };

    Kind kind = Kind::Invalid;
    std::string type;
    StateSnapshot state;
    bool auth_success = false;
    std::string error;
    std::string code;
};

InboundMessage DecodeInbound(const std::string& text);

// Counters and profile fields of a snapshot, in the SharedState vocabulary.
// canEdit is left out: the sync client owns that flag.
StatePatch SnapshotToPatch(const StateSnapshot& snapshot);

std::string BuildSessionUrl(const std::string& endpoint, const std::string& profile);

} // namespace bbd
