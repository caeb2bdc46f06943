#include "config.h"

#include <QtCore/QByteArray>
#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QJsonArray>
#include <QtCore/QJsonDocument>
#include <QtCore/QSaveFile>
#include <QtCore/QStringList>

#include <algorithm>
#include <cmath>
#include <iterator>
#include <sstream>
#include <utility>

namespace {

constexpr int kAllowedFps[] = {5, 10, 15, 20, 30};
constexpr int kAllowedCooldowns[] = {3, 5, 10};
constexpr double kMinThreshold = 0.5;
constexpr double kMaxThreshold = 0.95;

QStringList SplitKey(const std::string& key) {
    return QString::fromStdString(key).split(QLatin1Char('.'));
}

void DeepMerge(QJsonObject& base, const QJsonObject& updates) {
    for (auto it = updates.begin(); it != updates.end(); ++it) {
        const QJsonValue existing = base.value(it.key());
        if (existing.isObject() && it.value().isObject()) {
            QJsonObject nested = existing.toObject();
            DeepMerge(nested, it.value().toObject());
            base.insert(it.key(), nested);
        } else {
            base.insert(it.key(), it.value());
        }
    }
}

void SetPath(QJsonObject& obj, const QStringList& keys, int index, const QJsonValue& value) {
    const QString& key = keys.at(index);
    if (index == keys.size() - 1) {
        obj.insert(key, value);
        return;
    }
    QJsonObject child = obj.value(key).toObject();
    SetPath(child, keys, index + 1, value);
    obj.insert(key, child);
}

template <std::size_t N>
bool Contains(const int (&values)[N], int v) {
    return std::find(std::begin(values), std::end(values), v) != std::end(values);
}

void Warn(const bbd::LogFn& logger, const std::string& msg) {
    if (logger) {
        logger(bbd::LogLevel::Warning, msg);
    }
}

} // namespace

namespace bbd {

std::string Config::DefaultPath() {
    return QDir(QDir::homePath()).filePath(QStringLiteral(".bb-detector/config.json")).toStdString();
}

QJsonObject Config::Defaults() {
    QJsonObject profile;
    profile.insert(QStringLiteral("name"), QJsonValue::Null);
    profile.insert(QStringLiteral("password"), QJsonValue::Null);
    profile.insert(QStringLiteral("auto_connect"), true);

    QJsonObject connection;
    connection.insert(QStringLiteral("endpoint"), QStringLiteral("wss://soulsdeaths.somework.dev/ws"));
    connection.insert(QStringLiteral("reconnect_delay_ms"), 3000);
    connection.insert(QStringLiteral("max_reconnect_delay_ms"), 30000);

    QJsonObject detection;
    detection.insert(QStringLiteral("fps"), 10);
    detection.insert(QStringLiteral("death_cooldown"), 5);
    detection.insert(QStringLiteral("death_threshold"), 0.75);
    detection.insert(QStringLiteral("consecutive_hits"), 1);
    detection.insert(QStringLiteral("monitor"), 0);

    QJsonObject death_template;
    death_template.insert(QStringLiteral("builtin"), QStringLiteral("you_died_en.png"));
    death_template.insert(QStringLiteral("custom"), QJsonValue::Null);
    QJsonObject templates;
    templates.insert(QStringLiteral("death"), death_template);
    templates.insert(QStringLiteral("directory"), QStringLiteral("templates"));

    QJsonObject hotkeys;
    hotkeys.insert(QStringLiteral("manual_death"), QStringLiteral("ctrl+shift+d"));
    hotkeys.insert(QStringLiteral("toggle_boss"), QStringLiteral("ctrl+shift+b"));
    hotkeys.insert(QStringLiteral("toggle_detection"), QStringLiteral("ctrl+shift+p"));
    hotkeys.insert(QStringLiteral("show_overlay"), QStringLiteral("ctrl+shift+o"));

    QJsonObject calibration;
    calibration.insert(QStringLiteral("completed"), false);
    calibration.insert(QStringLiteral("death_region"), QJsonValue::Null);

    QJsonObject root;
    root.insert(QStringLiteral("profile"), profile);
    root.insert(QStringLiteral("connection"), connection);
    root.insert(QStringLiteral("detection"), detection);
    root.insert(QStringLiteral("templates"), templates);
    root.insert(QStringLiteral("hotkeys"), hotkeys);
    root.insert(QStringLiteral("calibration"), calibration);
    return root;
}

Config::Config(std::string path) : path_(std::move(path)), data_(Defaults()) {}

bool Config::Load() {
    QFile file(QString::fromStdString(path_));
    if (!file.open(QIODevice::ReadOnly)) {
        return false;
    }
    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &error);
    if (error.error != QJsonParseError::NoError || !doc.isObject()) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mu_);
    DeepMerge(data_, doc.object());
    return true;
}

bool Config::Save() const {
    const QString path = QString::fromStdString(path_);
    if (!QDir().mkpath(QFileInfo(path).absolutePath())) {
        return false;
    }
    QByteArray bytes;
    {
        std::lock_guard<std::mutex> lock(mu_);
        bytes = QJsonDocument(data_).toJson(QJsonDocument::Indented);
    }
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        return false;
    }
    if (file.write(bytes) != bytes.size()) {
        file.cancelWriting();
        return false;
    }
    return file.commit();
}

QJsonValue Config::Get(const std::string& key, const QJsonValue& fallback) const {
    const QStringList keys = SplitKey(key);
    std::lock_guard<std::mutex> lock(mu_);
    QJsonValue value = data_;
    for (const auto& k : keys) {
        if (!value.isObject()) {
            return fallback;
        }
        const QJsonObject obj = value.toObject();
        if (!obj.contains(k)) {
            return fallback;
        }
        value = obj.value(k);
    }
    return value.isNull() || value.isUndefined() ? fallback : value;
}

int Config::GetInt(const std::string& key, int fallback) const {
    const QJsonValue value = Get(key);
    return value.isDouble() ? value.toInt(fallback) : fallback;
}

double Config::GetDouble(const std::string& key, double fallback) const {
    const QJsonValue value = Get(key);
    return value.isDouble() ? value.toDouble(fallback) : fallback;
}

bool Config::GetBool(const std::string& key, bool fallback) const {
    const QJsonValue value = Get(key);
    return value.isBool() ? value.toBool() : fallback;
}

std::string Config::GetString(const std::string& key, const std::string& fallback) const {
    const QJsonValue value = Get(key);
    return value.isString() ? value.toString().toStdString() : fallback;
}

std::vector<int> Config::GetIntList(const std::string& key) const {
    std::vector<int> out;
    const QJsonValue value = Get(key);
    if (!value.isArray()) {
        return out;
    }
    for (const auto& item : value.toArray()) {
        if (!item.isDouble()) {
            return std::vector<int>();
        }
        out.push_back(item.toInt());
    }
    return out;
}

void Config::Set(const std::string& key, const QJsonValue& value) {
    const QStringList keys = SplitKey(key);
    std::lock_guard<std::mutex> lock(mu_);
    SetPath(data_, keys, 0, value);
}

DetectionSettings LoadDetectionSettings(const Config& config, const LogFn& logger) {
    DetectionSettings settings;

    const int fps = config.GetInt("detection.fps", settings.fps);
    if (Contains(kAllowedFps, fps)) {
        settings.fps = fps;
    } else {
        std::ostringstream oss;
        oss << "config detection.fps=" << fps << " not allowed; using " << settings.fps;
        Warn(logger, oss.str());
    }

    const double cooldown = config.GetDouble("detection.death_cooldown", settings.cooldown_seconds);
    const bool in_range = std::isfinite(cooldown) && cooldown >= kAllowedCooldowns[0] &&
                          cooldown <= kAllowedCooldowns[std::size(kAllowedCooldowns) - 1];
    const int cooldown_whole = in_range ? static_cast<int>(cooldown) : 0;
    if (in_range && cooldown == static_cast<double>(cooldown_whole) && Contains(kAllowedCooldowns, cooldown_whole)) {
        settings.cooldown_seconds = cooldown_whole;
    } else {
        std::ostringstream oss;
        oss << "config detection.death_cooldown=" << cooldown << " not allowed; using "
            << settings.cooldown_seconds;
        Warn(logger, oss.str());
    }

    const double threshold = config.GetDouble("detection.death_threshold", settings.threshold);
    settings.threshold = std::isfinite(threshold) ? std::clamp(threshold, kMinThreshold, kMaxThreshold)
                                                  : settings.threshold;
    if (settings.threshold != threshold) {
        std::ostringstream oss;
        oss << "config detection.death_threshold=" << threshold << " clamped to " << settings.threshold;
        Warn(logger, oss.str());
    }

    settings.consecutive_hits = std::max(1, config.GetInt("detection.consecutive_hits", 1));

    const std::vector<int> region = config.GetIntList("calibration.death_region");
    if (region.size() == 4 && region[2] > 0 && region[3] > 0) {
        settings.region = Region{region[0], region[1], region[2], region[3]};
    } else if (!config.Get("calibration.death_region").isNull()) {
        Warn(logger, "config calibration.death_region invalid; capturing full screen");
    }

    const std::string custom = config.GetString("templates.death.custom", std::string());
    if (!custom.empty()) {
        settings.template_path = custom;
    } else {
        const QString dir = QString::fromStdString(config.GetString("templates.directory", "templates"));
        const QString builtin = QString::fromStdString(config.GetString("templates.death.builtin", "you_died_en.png"));
        settings.template_path = QDir(dir).filePath(builtin).toStdString();
    }
    return settings;
}

} // namespace bbd
