#pragma once

#include "log.h"

#include <QtCore/QJsonObject>
#include <QtCore/QJsonValue>

#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace bbd {

// JSON settings file addressed with dotted keys ("detection.fps"). Loaded
// values are deep-merged over built-in defaults. Thread-safe.
class Config {
public:
    static std::string DefaultPath();
    static QJsonObject Defaults();

    explicit Config(std::string path = DefaultPath());

    const std::string& Path() const { return path_; }

    // False if the file is missing or not a JSON object; defaults stay in place.
    bool Load();
    bool Save() const;

    // Missing keys and JSON null both yield the fallback.
    QJsonValue Get(const std::string& key, const QJsonValue& fallback = QJsonValue()) const;
    int GetInt(const std::string& key, int fallback) const;
    double GetDouble(const std::string& key, double fallback) const;
    bool GetBool(const std::string& key, bool fallback) const;
    std::string GetString(const std::string& key, const std::string& fallback) const;
    std::vector<int> GetIntList(const std::string& key) const;

    void Set(const std::string& key, const QJsonValue& value);

private:
    std::string path_;
    mutable std::mutex mu_;
    QJsonObject data_;
};

struct Region {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;
};

struct DetectionSettings {
    int fps = 10;
    int cooldown_seconds = 5;
    double threshold = 0.75;
    int consecutive_hits = 1;
    std::optional<Region> region;
    std::string template_path;
};

// Reads detection.*, templates.* and calibration.death_region, replacing
// out-of-range values with defaults and reporting each replacement.
DetectionSettings LoadDetectionSettings(const Config& config, const LogFn& logger = LogFn());

} // namespace bbd
