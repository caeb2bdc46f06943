#include "shared_state.h"

#include <array>
#include <exception>
#include <sstream>

namespace {

using bbd::Field;

struct FieldSpec {
    Field field;
    const char* name;
    std::size_t kind; // index into StateValue
};

constexpr std::size_t kBool = 0;
constexpr std::size_t kInt = 1;
constexpr std::size_t kText = 2;

constexpr std::array<FieldSpec, bbd::kFieldCount> kFields = {{
    {Field::DeathCount, "deathCount", kInt},
    {Field::ElapsedMs, "elapsedMs", kInt},
    {Field::Running, "running", kBool},
    {Field::BossMode, "bossMode", kBool},
    {Field::BossPaused, "bossPaused", kBool},
    {Field::BossDeathCount, "bossDeathCount", kInt},
    {Field::Connected, "connected", kBool},
    {Field::CanEdit, "canEdit", kBool},
    {Field::DetectionEnabled, "detectionEnabled", kBool},
    {Field::ProfileId, "profileId", kText},
    {Field::ProfileDisplayName, "profileDisplayName", kText},
}};

const FieldSpec& SpecOf(Field field) {
    return kFields[static_cast<std::size_t>(field)];
}

const char* KindName(std::size_t kind) {
    switch (kind) {
    case kBool:
        return "bool";
    case kInt:
        return "int";
    default:
        return "string";
    }
}

} // namespace

namespace bbd {

const char* FieldName(Field field) {
    return SpecOf(field).name;
}

Field FieldFromName(const std::string& name) {
    for (const auto& spec : kFields) {
        if (name == spec.name) {
            return spec.field;
        }
    }
    throw UnknownFieldError(name);
}

std::string DescribeValue(const StateValue& value) {
    if (const bool* b = std::get_if<bool>(&value)) {
        return *b ? "true" : "false";
    }
    if (const std::int64_t* i = std::get_if<std::int64_t>(&value)) {
        return std::to_string(*i);
    }
    return "\"" + std::get<std::string>(value) + "\"";
}

SharedState::SharedState() = default;

void SharedState::CheckKind(Field field, const StateValue& value) {
    const FieldSpec& spec = SpecOf(field);
    if (value.index() == spec.kind) {
        return;
    }
    std::ostringstream oss;
    oss << "field " << spec.name << " expects " << KindName(spec.kind) << ", got "
        << KindName(value.index());
    throw FieldTypeError(oss.str());
}

StateValue SharedState::Read(Field field) const {
    switch (field) {
    case Field::DeathCount:
        return state_.death_count;
    case Field::ElapsedMs:
        return state_.elapsed_ms;
    case Field::Running:
        return state_.running;
    case Field::BossMode:
        return state_.boss_mode;
    case Field::BossPaused:
        return state_.boss_paused;
    case Field::BossDeathCount:
        return state_.boss_death_count;
    case Field::Connected:
        return state_.connected;
    case Field::CanEdit:
        return state_.can_edit;
    case Field::DetectionEnabled:
        return state_.detection_enabled;
    case Field::ProfileId:
        return state_.profile_id;
    case Field::ProfileDisplayName:
        return state_.profile_display_name;
    }
    throw UnknownFieldError(std::to_string(static_cast<int>(field)));
}

void SharedState::Write(Field field, const StateValue& value) {
    switch (field) {
    case Field::DeathCount:
        state_.death_count = std::get<std::int64_t>(value);
        break;
    case Field::ElapsedMs:
        state_.elapsed_ms = std::get<std::int64_t>(value);
        break;
    case Field::Running:
        state_.running = std::get<bool>(value);
        break;
    case Field::BossMode:
        state_.boss_mode = std::get<bool>(value);
        break;
    case Field::BossPaused:
        state_.boss_paused = std::get<bool>(value);
        break;
    case Field::BossDeathCount:
        state_.boss_death_count = std::get<std::int64_t>(value);
        break;
    case Field::Connected:
        state_.connected = std::get<bool>(value);
        break;
    case Field::CanEdit:
        state_.can_edit = std::get<bool>(value);
        break;
    case Field::DetectionEnabled:
        state_.detection_enabled = std::get<bool>(value);
        break;
    case Field::ProfileId:
        state_.profile_id = std::get<std::string>(value);
        break;
    case Field::ProfileDisplayName:
        state_.profile_display_name = std::get<std::string>(value);
        break;
    }
}

StateValue SharedState::Get(Field field) const {
    std::shared_lock<std::shared_mutex> lock(data_mu_);
    return Read(field);
}

StateValue SharedState::Get(const std::string& name) const {
    return Get(FieldFromName(name));
}

bool SharedState::GetBool(Field field) const {
    const StateValue value = Get(field);
    CheckKind(field, StateValue(false));
    return std::get<bool>(value);
}

std::int64_t SharedState::GetInt(Field field) const {
    const StateValue value = Get(field);
    CheckKind(field, StateValue(std::int64_t{0}));
    return std::get<std::int64_t>(value);
}

std::string SharedState::GetText(Field field) const {
    const StateValue value = Get(field);
    CheckKind(field, StateValue(std::string()));
    return std::get<std::string>(value);
}

SessionState SharedState::Snapshot() const {
    std::shared_lock<std::shared_mutex> lock(data_mu_);
    return state_;
}

void SharedState::Set(Field field, const StateValue& value) {
    Merge(StatePatch{{field, value}});
}

void SharedState::Set(const std::string& name, const StateValue& value) {
    Set(FieldFromName(name), value);
}

void SharedState::Merge(const StatePatch& patch) {
    for (const auto& entry : patch) {
        CheckKind(entry.first, entry.second);
    }

    std::lock_guard<std::recursive_mutex> write_lock(write_mu_);
    std::vector<std::pair<Field, StateValue>> changes;
    {
        std::unique_lock<std::shared_mutex> lock(data_mu_);
        std::vector<std::pair<Field, StateValue>> before;
        for (const auto& entry : patch) {
            bool seen = false;
            for (const auto& prior : before) {
                if (prior.first == entry.first) {
                    seen = true;
                    break;
                }
            }
            if (!seen) {
                before.emplace_back(entry.first, Read(entry.first));
            }
            Write(entry.first, entry.second);
        }
        // Compare against first-touch values so a field written twice back to its
        // original value stays silent.
        for (const auto& prior : before) {
            StateValue now = Read(prior.first);
            if (now != prior.second) {
                changes.emplace_back(prior.first, std::move(now));
            }
        }
    }
    Notify(changes);
}

SharedState::SubscriptionId SharedState::Subscribe(Listener listener) {
    std::lock_guard<std::mutex> lock(listeners_mu_);
    const SubscriptionId id = next_subscription_id_++;
    listeners_.push_back(Subscription{id, std::move(listener)});
    return id;
}

void SharedState::Unsubscribe(SubscriptionId id) {
    // Waits for an in-flight notification; the listener is not called after return.
    std::lock_guard<std::recursive_mutex> write_lock(write_mu_);
    std::lock_guard<std::mutex> lock(listeners_mu_);
    for (auto it = listeners_.begin(); it != listeners_.end(); ++it) {
        if (it->id == id) {
            listeners_.erase(it);
            return;
        }
    }
}

bool SharedState::IsSubscribed(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(listeners_mu_);
    for (const auto& sub : listeners_) {
        if (sub.id == id) {
            return true;
        }
    }
    return false;
}

void SharedState::SetListenerErrorHook(ListenerErrorHook hook) {
    std::lock_guard<std::mutex> lock(listeners_mu_);
    error_hook_ = std::move(hook);
}

void SharedState::Notify(const std::vector<std::pair<Field, StateValue>>& changes) {
    if (changes.empty()) {
        return;
    }
    std::vector<Subscription> listeners;
    ListenerErrorHook hook;
    {
        std::lock_guard<std::mutex> lock(listeners_mu_);
        listeners = listeners_;
        hook = error_hook_;
    }

    for (const auto& change : changes) {
        for (const auto& sub : listeners) {
            if (!sub.listener || !IsSubscribed(sub.id)) {
                continue;
            }
            try {
                sub.listener(change.first, change.second);
            } catch (const std::exception& e) {
                if (hook) {
                    hook(change.first, e.what());
                }
            } catch (...) {
                if (hook) {
                    hook(change.first, "non-standard exception");
                }
            }
        }
    }
}

} // namespace bbd
