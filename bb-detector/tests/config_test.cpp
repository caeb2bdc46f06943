#include "config.h"

#include <gtest/gtest.h>

#include <QtCore/QByteArray>
#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QJsonArray>
#include <QtCore/QTemporaryDir>

#include <limits>
#include <string>
#include <vector>

namespace bbd {
namespace {

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override { ASSERT_TRUE(dir_.isValid()); }

    std::string PathOf(const char* name) const { return dir_.filePath(QString::fromLatin1(name)).toStdString(); }

    std::string WriteFile(const char* name, const QByteArray& bytes) const {
        const std::string path = PathOf(name);
        QFile file(QString::fromStdString(path));
        EXPECT_TRUE(file.open(QIODevice::WriteOnly));
        file.write(bytes);
        return path;
    }

    QTemporaryDir dir_;
};

TEST_F(ConfigTest, DefaultsAreAvailableWithoutFile) {
    Config config(PathOf("absent.json"));
    EXPECT_FALSE(config.Load());
    EXPECT_EQ(config.GetInt("detection.fps", 0), 10);
    EXPECT_DOUBLE_EQ(config.GetDouble("detection.death_threshold", 0.0), 0.75);
    EXPECT_EQ(config.GetString("hotkeys.manual_death", ""), "ctrl+shift+d");
    EXPECT_TRUE(config.GetBool("profile.auto_connect", false));
    EXPECT_EQ(config.GetString("profile.name", "none"), "none");
}

TEST_F(ConfigTest, LoadDeepMergesOverDefaults) {
    Config config(WriteFile("config.json", R"({"detection": {"fps": 20}, "profile": {"name": "run1"}})"));
    ASSERT_TRUE(config.Load());
    EXPECT_EQ(config.GetInt("detection.fps", 0), 20);
    EXPECT_EQ(config.GetInt("detection.death_cooldown", 0), 5);
    EXPECT_EQ(config.GetString("profile.name", ""), "run1");
    EXPECT_TRUE(config.GetBool("profile.auto_connect", false));
}

TEST_F(ConfigTest, MalformedFileKeepsDefaults) {
    Config config(WriteFile("broken.json", "{ not json"));
    EXPECT_FALSE(config.Load());
    EXPECT_EQ(config.GetInt("detection.fps", 0), 10);

    Config array_root(WriteFile("array.json", "[1, 2, 3]"));
    EXPECT_FALSE(array_root.Load());
}

TEST_F(ConfigTest, WrongTypeYieldsFallback) {
    Config config(WriteFile("types.json", R"({"detection": {"fps": "fast"}})"));
    ASSERT_TRUE(config.Load());
    EXPECT_EQ(config.GetInt("detection.fps", 7), 7);
    EXPECT_EQ(config.GetInt("detection.fps.nested", 7), 7);
}

TEST_F(ConfigTest, SetCreatesIntermediateObjects) {
    Config config(PathOf("set.json"));
    config.Set("overlay.position.x", 42);
    config.Set("detection.fps", 15);
    EXPECT_EQ(config.GetInt("overlay.position.x", 0), 42);
    EXPECT_EQ(config.GetInt("detection.fps", 0), 15);
    EXPECT_EQ(config.GetInt("detection.death_cooldown", 0), 5);
}

TEST_F(ConfigTest, SaveThenReload) {
    const std::string path = dir_.filePath(QStringLiteral("nested/dir/config.json")).toStdString();
    Config config(path);
    config.Set("profile.name", QStringLiteral("speedrun"));
    config.Set("calibration.death_region", QJsonArray{1, 2, 3, 4});
    ASSERT_TRUE(config.Save());

    Config reloaded(path);
    ASSERT_TRUE(reloaded.Load());
    EXPECT_EQ(reloaded.GetString("profile.name", ""), "speedrun");
    EXPECT_EQ(reloaded.GetIntList("calibration.death_region"), (std::vector<int>{1, 2, 3, 4}));
}

TEST_F(ConfigTest, DetectionSettingsDefaults) {
    Config config(PathOf("absent.json"));
    const DetectionSettings settings = LoadDetectionSettings(config);
    EXPECT_EQ(settings.fps, 10);
    EXPECT_EQ(settings.cooldown_seconds, 5);
    EXPECT_DOUBLE_EQ(settings.threshold, 0.75);
    EXPECT_EQ(settings.consecutive_hits, 1);
    EXPECT_FALSE(settings.region.has_value());
    EXPECT_EQ(settings.template_path, QDir(QStringLiteral("templates")).filePath(QStringLiteral("you_died_en.png")).toStdString());
}

TEST_F(ConfigTest, DetectionSettingsReplaceOutOfRangeValues) {
    Config config(PathOf("absent.json"));
    config.Set("detection.fps", 7);
    config.Set("detection.death_cooldown", 4);
    config.Set("detection.death_threshold", 0.3);
    config.Set("detection.consecutive_hits", 0);

    std::vector<std::string> warnings;
    const DetectionSettings settings = LoadDetectionSettings(config, [&warnings](LogLevel level, const std::string& msg) {
        if (level == LogLevel::Warning) {
            warnings.push_back(msg);
        }
    });
    EXPECT_EQ(settings.fps, 10);
    EXPECT_EQ(settings.cooldown_seconds, 5);
    EXPECT_DOUBLE_EQ(settings.threshold, 0.5);
    EXPECT_EQ(settings.consecutive_hits, 1);
    EXPECT_EQ(warnings.size(), 3u);

    config.Set("detection.death_threshold", 0.99);
    config.Set("detection.death_cooldown", 2.5);
    const DetectionSettings high = LoadDetectionSettings(config);
    EXPECT_DOUBLE_EQ(high.threshold, 0.95);
    EXPECT_EQ(high.cooldown_seconds, 5);
}

TEST_F(ConfigTest, DetectionSettingsRejectHugeOrNonFiniteCooldown) {
    Config config(PathOf("absent.json"));
    config.Set("detection.death_cooldown", 1e20);
    EXPECT_EQ(LoadDetectionSettings(config).cooldown_seconds, 5);
    config.Set("detection.death_cooldown", -1e20);
    EXPECT_EQ(LoadDetectionSettings(config).cooldown_seconds, 5);
    config.Set("detection.death_cooldown", std::numeric_limits<double>::infinity());
    EXPECT_EQ(LoadDetectionSettings(config).cooldown_seconds, 5);
}

TEST_F(ConfigTest, DetectionSettingsAcceptAllowedValues) {
    Config config(PathOf("absent.json"));
    config.Set("detection.fps", 30);
    config.Set("detection.death_cooldown", 10);
    config.Set("detection.death_threshold", 0.8);
    config.Set("detection.consecutive_hits", 3);
    const DetectionSettings settings = LoadDetectionSettings(config);
    EXPECT_EQ(settings.fps, 30);
    EXPECT_EQ(settings.cooldown_seconds, 10);
    EXPECT_DOUBLE_EQ(settings.threshold, 0.8);
    EXPECT_EQ(settings.consecutive_hits, 3);
}

TEST_F(ConfigTest, DetectionSettingsRegion) {
    Config config(PathOf("absent.json"));
    config.Set("calibration.death_region", QJsonArray{100, 200, 640, 120});
    const DetectionSettings settings = LoadDetectionSettings(config);
    ASSERT_TRUE(settings.region.has_value());
    EXPECT_EQ(settings.region->x, 100);
    EXPECT_EQ(settings.region->y, 200);
    EXPECT_EQ(settings.region->width, 640);
    EXPECT_EQ(settings.region->height, 120);

    config.Set("calibration.death_region", QJsonArray{100, 200, 0, 120});
    EXPECT_FALSE(LoadDetectionSettings(config).region.has_value());
    config.Set("calibration.death_region", QJsonArray{1, 2, 3});
    EXPECT_FALSE(LoadDetectionSettings(config).region.has_value());
}

TEST_F(ConfigTest, CustomTemplateWins) {
    Config config(PathOf("absent.json"));
    config.Set("templates.directory", QStringLiteral("/opt/bbd/templates"));
    config.Set("templates.death.builtin", QStringLiteral("you_died_de.png"));
    EXPECT_EQ(LoadDetectionSettings(config).template_path, "/opt/bbd/templates/you_died_de.png");

    config.Set("templates.death.custom", QStringLiteral("/home/me/death.png"));
    EXPECT_EQ(LoadDetectionSettings(config).template_path, "/home/me/death.png");
}

} // namespace
} // namespace bbd
