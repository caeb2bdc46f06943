#include "protocol.h"

#include <QtCore/QByteArray>
#include <QtCore/QJsonDocument>
#include <QtCore/QJsonObject>
#include <QtCore/QJsonParseError>
#include <QtCore/QJsonValue>
#include <QtCore/QString>
#include <QtCore/QUrl>
#include <QtCore/QUrlQuery>

#include <cmath>

namespace {

constexpr const char* kDefaultMilestoneIcon = "★";

QString Q(const char* s) {
    return QString::fromUtf8(s);
}

QString Q(const std::string& s) {
    return QString::fromStdString(s);
}

std::string ToCompactJson(const QJsonObject& obj) {
    return QJsonDocument(obj).toJson(QJsonDocument::Compact).toStdString();
}

// JSON numbers arrive as doubles; counters must be whole and non-negative.
void ReadCount(const QJsonObject& obj, const char* key, bool* has, std::int64_t* out) {
    const QJsonValue v = obj.value(Q(key));
    if (!v.isDouble()) {
        return;
    }
    const double d = v.toDouble();
    if (!std::isfinite(d) || d < 0.0 || d != std::floor(d)) {
        return;
    }
    *has = true;
    *out = v.toInteger();
}

void ReadFlag(const QJsonObject& obj, const char* key, bool* has, bool* out) {
    const QJsonValue v = obj.value(Q(key));
    if (!v.isBool()) {
        return;
    }
    *has = true;
    *out = v.toBool();
}

// A null profile name clears the field; absence leaves it untouched.
void ReadOptionalText(const QJsonObject& obj, const char* key, bool* has, std::string* out) {
    const QJsonValue v = obj.value(Q(key));
    if (v.isString()) {
        *has = true;
        *out = v.toString().toStdString();
    } else if (v.isNull()) {
        *has = true;
        out->clear();
    }
}

} // namespace

namespace bbd {

Command Command::Of(CommandType type) {
    Command c;
    c.type = type;
    return c;
}

Command Command::BossVictory(const std::string& boss_name) {
    Command c = Of(CommandType::BossVictory);
    c.name = boss_name;
    return c;
}

Command Command::SetTime(std::int64_t elapsed_ms) {
    Command c = Of(CommandType::SetTime);
    c.value = elapsed_ms;
    c.has_value = true;
    return c;
}

Command Command::SetDeaths(std::int64_t deaths) {
    Command c = Of(CommandType::SetDeaths);
    c.value = deaths;
    c.has_value = true;
    return c;
}

Command Command::MilestoneAdd(const std::string& name, const std::string& icon) {
    Command c = Of(CommandType::MilestoneAdd);
    c.name = name;
    c.icon = icon.empty() ? kDefaultMilestoneIcon : icon;
    return c;
}

Command Command::MilestoneEdit(const std::string& id,
                               const std::string& name,
                               const std::string& icon,
                               bool has_timestamp,
                               std::int64_t timestamp) {
    Command c = Of(CommandType::MilestoneEdit);
    c.id = id;
    c.name = name;
    c.icon = icon;
    c.has_value = has_timestamp;
    c.value = timestamp;
    return c;
}

Command Command::MilestoneDelete(const std::string& id) {
    Command c = Of(CommandType::MilestoneDelete);
    c.id = id;
    return c;
}

const char* CommandWireType(CommandType type) {
    switch (type) {
    case CommandType::Death:
        return "bb-death";
    case CommandType::BossDeath:
        return "bb-boss-death";
    case CommandType::BossStart:
        return "bb-boss-start";
    case CommandType::BossPause:
        return "bb-boss-pause";
    case CommandType::BossResume:
        return "bb-boss-resume";
    case CommandType::BossVictory:
        return "bb-boss-victory";
    case CommandType::BossCancel:
        return "bb-boss-cancel";
    case CommandType::StartTimer:
        return "bb-start";
    case CommandType::StopTimer:
        return "bb-stop";
    case CommandType::ResetTimer:
        return "bb-reset";
    case CommandType::SetTime:
        return "bb-set-time";
    case CommandType::SetDeaths:
        return "bb-set-deaths";
    case CommandType::MilestoneAdd:
        return "bb-milestone-add";
    case CommandType::MilestoneEdit:
        return "bb-milestone-edit";
    case CommandType::MilestoneDelete:
        return "bb-milestone-delete";
    }
    return "bb-unknown";
}

std::string EncodeCommand(const Command& command) {
    QJsonObject obj;
    obj.insert(Q("type"), Q(CommandWireType(command.type)));
    switch (command.type) {
    case CommandType::BossVictory:
        obj.insert(Q("name"), Q(command.name));
        break;
    case CommandType::SetTime:
        obj.insert(Q("elapsed"), static_cast<qint64>(command.value));
        break;
    case CommandType::SetDeaths:
        obj.insert(Q("deaths"), static_cast<qint64>(command.value));
        break;
    case CommandType::MilestoneAdd:
        obj.insert(Q("name"), Q(command.name));
        obj.insert(Q("icon"), Q(command.icon));
        break;
    case CommandType::MilestoneEdit:
        obj.insert(Q("id"), Q(command.id));
        obj.insert(Q("name"), Q(command.name));
        obj.insert(Q("icon"), Q(command.icon));
        if (command.has_value) {
            obj.insert(Q("timestamp"), static_cast<qint64>(command.value));
        }
        break;
    case CommandType::MilestoneDelete:
        obj.insert(Q("id"), Q(command.id));
        break;
    default:
        break;
    }
    return ToCompactJson(obj);
}

std::string EncodeAuth(const std::string& password) {
    QJsonObject obj;
    obj.insert(Q("type"), Q("bb-auth"));
    obj.insert(Q("password"), Q(password));
    return ToCompactJson(obj);
}

InboundMessage DecodeInbound(const std::string& text) {
    InboundMessage msg;
    QJsonParseError parse_error{};
    const QJsonDocument doc = QJsonDocument::fromJson(QByteArray::fromStdString(text), &parse_error);
    if (parse_error.error != QJsonParseError::NoError || !doc.isObject()) {
        return msg;
    }
    const QJsonObject obj = doc.object();
    const QJsonValue type_val = obj.value(Q("type"));
    if (!type_val.isString()) {
        return msg;
    }
    msg.type = type_val.toString().toStdString();

    if (msg.type == "bb-state") {
        StateSnapshot& s = msg.state;
        ReadCount(obj, "deaths", &s.has_deaths, &s.deaths);
        ReadCount(obj, "elapsed", &s.has_elapsed, &s.elapsed);
        ReadFlag(obj, "isRunning", &s.has_is_running, &s.is_running);
        ReadFlag(obj, "bossFightMode", &s.has_boss_fight_mode, &s.boss_fight_mode);
        ReadCount(obj, "bossDeaths", &s.has_boss_deaths, &s.boss_deaths);
        ReadFlag(obj, "bossPaused", &s.has_boss_paused, &s.boss_paused);
        ReadFlag(obj, "canEdit", &s.has_can_edit, &s.can_edit);
        ReadOptionalText(obj, "profileName", &s.has_profile_name, &s.profile_name);
        ReadOptionalText(obj, "displayName", &s.has_display_name, &s.display_name);
        msg.kind = InboundMessage::Kind::State;
        return msg;
    }

    if (msg.type == "bb-auth-result") {
        const QJsonValue success = obj.value(Q("success"));
        msg.auth_success = success.isBool() && success.toBool();
        msg.error = obj.value(Q("error")).toString().toStdString();
        msg.kind = InboundMessage::Kind::AuthResult;
        return msg;
    }

    if (msg.type == "bb-error") {
        msg.error = obj.value(Q("error")).toString().toStdString();
        const QJsonValue code = obj.value(Q("code"));
        msg.code = code.isDouble() ? std::to_string(code.toInteger()) : code.toString().toStdString();
        msg.kind = InboundMessage::Kind::Error;
        return msg;
    }

    msg.kind = InboundMessage::Kind::Other;
    return msg;
}

StatePatch SnapshotToPatch(const StateSnapshot& s) {
    StatePatch patch;
    if (s.has_deaths) {
        patch.emplace_back(Field::DeathCount, s.deaths);
    }
    if (s.has_elapsed) {
        patch.emplace_back(Field::ElapsedMs, s.elapsed);
    }
    if (s.has_is_running) {
        patch.emplace_back(Field::Running, s.is_running);
    }
    if (s.has_boss_fight_mode) {
        patch.emplace_back(Field::BossMode, s.boss_fight_mode);
    }
    if (s.has_boss_deaths) {
        patch.emplace_back(Field::BossDeathCount, s.boss_deaths);
    }
    if (s.has_boss_paused) {
        patch.emplace_back(Field::BossPaused, s.boss_paused);
    }
    if (s.has_profile_name) {
        patch.emplace_back(Field::ProfileId, s.profile_name);
    }
    if (s.has_display_name) {
        patch.emplace_back(Field::ProfileDisplayName, s.display_name);
    }
    return patch;
}

std::string BuildSessionUrl(const std::string& endpoint, const std::string& profile) {
    QUrl url(Q(endpoint));
    QUrlQuery query;
    query.addQueryItem(Q("bloodborne"), Q("true"));
    query.addQueryItem(Q("profile"), QString::fromUtf8(QUrl::toPercentEncoding(Q(profile))));
    url.setQuery(query);
    return url.toString(QUrl::FullyEncoded).toStdString();
}

} // namespace bbd
