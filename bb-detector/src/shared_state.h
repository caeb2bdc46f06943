#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace bbd {

enum class Field {
    DeathCount,
    ElapsedMs,
    Running,
    BossMode,
    BossPaused,
    BossDeathCount,
    Connected,
    CanEdit,
    DetectionEnabled,
    ProfileId,
    ProfileDisplayName,
};

constexpr std::size_t kFieldCount = 11;

// bool for flags, int64 for counters and milliseconds, string for profile text.
using StateValue = std::variant<bool, std::int64_t, std::string>;

// Ordered partial update; later entries for the same field win.
using StatePatch = std::vector<std::pair<Field, StateValue>>;

class UnknownFieldError : public std::invalid_argument {
public:
    explicit UnknownFieldError(const std::string& name)
        : std::invalid_argument("unknown state field: " + name), name_(name) {}

    const std::string& name() const { return name_; }

private:
    std::string name_;
};

class FieldTypeError : public std::invalid_argument {
public:
    explicit FieldTypeError(const std::string& what) : std::invalid_argument(what) {}
};

struct SessionState {
    std::int64_t death_count = 0;
    std::int64_t elapsed_ms = 0;
    bool running = false;
    bool boss_mode = false;
    bool boss_paused = false;
    std::int64_t boss_death_count = 0;
    bool connected = false;
    bool can_edit = false;
    bool detection_enabled = true;
    std::string profile_id;
    std::string profile_display_name;
};

const char* FieldName(Field field);
Field FieldFromName(const std::string& name);
std::string DescribeValue(const StateValue& value);

class SharedState {
public:
    using Listener = std::function<void(Field field, const StateValue& value)>;
    using ListenerErrorHook = std::function<void(Field field, const std::string& what)>;
    using SubscriptionId = std::uint64_t;

    SharedState();

    SharedState(const SharedState&) = delete;
    SharedState& operator=(const SharedState&) = delete;

    StateValue Get(Field field) const;
    StateValue Get(const std::string& name) const;
    bool GetBool(Field field) const;
    std::int64_t GetInt(Field field) const;
    std::string GetText(Field field) const;
    SessionState Snapshot() const;

    void Set(Field field, const StateValue& value);
    void Set(const std::string& name, const StateValue& value);
    void Merge(const StatePatch& patch);

    SubscriptionId Subscribe(Listener listener);
    // Blocks until any notification in progress on another thread has finished.
    void Unsubscribe(SubscriptionId id);
    void SetListenerErrorHook(ListenerErrorHook hook);

private:
    struct Subscription {
        SubscriptionId id;
        Listener listener;
    };

    static void CheckKind(Field field, const StateValue& value);
    StateValue Read(Field field) const;
    void Write(Field field, const StateValue& value);
    void Notify(const std::vector<std::pair<Field, StateValue>>& changes);
    bool IsSubscribed(SubscriptionId id);

    // Serializes writers and their notifications; recursive so a listener may write.
    std::recursive_mutex write_mu_;
    mutable std::shared_mutex data_mu_;
    SessionState state_;

    std::mutex listeners_mu_;
    std::vector<Subscription> listeners_;
    SubscriptionId next_subscription_id_ = 1;
    ListenerErrorHook error_hook_;
};

} // namespace bbd
