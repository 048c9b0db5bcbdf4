#include <gtest/gtest.h>
#include "ConfigManager.hpp"
#include "TestSupport.hpp"
#include <sampler-monitor/Constants.hpp>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>

namespace sampler_monitor {
namespace testing {

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(dir.isValid());
        path = dir.filePath("settings/op-1z_sm_config.json").toStdString();
    }

    QJsonObject readBack() const {
        QFile file(QString::fromStdString(path));
        if (!file.open(QIODevice::ReadOnly)) {
            return {};
        }
        return QJsonDocument::fromJson(file.readAll()).object();
    }

    QTemporaryDir dir;
    std::string path;
    ConfigManager config;
};

TEST_F(ConfigManagerTest, Defaults) {
    EXPECT_FALSE(config.developerMode());
    EXPECT_TRUE(config.contains(ConfigKeys::DEVELOPER_MODE));
    EXPECT_FALSE(config.contains(ConfigKeys::OPZ_MOUNT_PATH));
    EXPECT_EQ(config.getString(ConfigKeys::OPZ_MOUNT_PATH), "");
    EXPECT_EQ(config.getInt("missing", 7), 7);
}

TEST_F(ConfigManagerTest, EmptyStringFallsBackToDefault) {
    config.setString(ConfigKeys::OP1_DETECTED_PATH, "");
    EXPECT_EQ(config.getString(ConfigKeys::OP1_DETECTED_PATH, "/fallback"), "/fallback");
    EXPECT_EQ(config.getString(ConfigKeys::OP1_DETECTED_PATH), "");
}

TEST_F(ConfigManagerTest, TypeMismatchReturnsDefault) {
    config.setString("threshold", "high");
    EXPECT_EQ(config.getInt("threshold", 3), 3);
    config.setInt("threshold", 4);
    EXPECT_DOUBLE_EQ(config.getDouble("threshold"), 4.0);
}

TEST_F(ConfigManagerTest, EffectiveMountPathFollowsDeveloperMode) {
    config.setString(ConfigKeys::OPZ_MOUNT_PATH, "/manual/opz");
    config.setString(ConfigKeys::OPZ_DETECTED_PATH, "/Volumes/OP-Z");

    EXPECT_EQ(config.effectiveMountPath(opz()), "/Volumes/OP-Z");
    config.setBool(ConfigKeys::DEVELOPER_MODE, true);
    EXPECT_EQ(config.effectiveMountPath(opz()), "/manual/opz");
    EXPECT_EQ(config.effectiveMountPath(op1()), "");
}

TEST_F(ConfigManagerTest, SetWritesStorageFile) {
    config.setStorageFile(path);
    config.setString(ConfigKeys::OP1_DETECTED_PATH, "/Volumes/OP-1");

    QJsonObject saved = readBack();
    EXPECT_EQ(saved.value(ConfigKeys::OP1_DETECTED_PATH).toString(), "/Volumes/OP-1");
    EXPECT_FALSE(saved.value(ConfigKeys::DEVELOPER_MODE).toBool(true));
}

TEST_F(ConfigManagerTest, LoadRestoresSavedValues) {
    config.setBool(ConfigKeys::DEVELOPER_MODE, true);
    config.setString(ConfigKeys::OPZ_MOUNT_PATH, "/manual/opz");
    config.setInt("poll_attempts", 12);
    config.setDouble("ratio", 0.5);
    ASSERT_TRUE(config.saveToFile(path));

    ConfigManager loaded;
    ASSERT_TRUE(loaded.loadFromFile(path));
    EXPECT_TRUE(loaded.developerMode());
    EXPECT_EQ(loaded.getString(ConfigKeys::OPZ_MOUNT_PATH), "/manual/opz");
    EXPECT_EQ(loaded.getInt("poll_attempts"), 12);
    EXPECT_DOUBLE_EQ(loaded.getDouble("ratio"), 0.5);
    EXPECT_EQ(loaded.storageFile(), path);
}

TEST_F(ConfigManagerTest, InvalidFileIsRejected) {
    QDir().mkpath(QFileInfo(QString::fromStdString(path)).absolutePath());
    QFile file(QString::fromStdString(path));
    ASSERT_TRUE(file.open(QIODevice::WriteOnly));
    file.write("{ not json");
    file.close();

    EXPECT_FALSE(config.loadFromFile(path));
    EXPECT_FALSE(config.loadFromFile(dir.filePath("absent.json").toStdString()));
    EXPECT_TRUE(config.storageFile().empty());
}

TEST_F(ConfigManagerTest, ChangeSignalCarriesKey) {
    std::vector<std::string> keys;
    QObject::connect(&config, &ConfigManager::configChanged,
        [&keys](const std::string& key) { keys.push_back(key); });

    config.setString(ConfigKeys::OP1_MOUNT_PATH, "/manual/op1");
    ASSERT_EQ(keys.size(), 1u);
    EXPECT_EQ(keys.front(), ConfigKeys::OP1_MOUNT_PATH);
}

TEST_F(ConfigManagerTest, ResetDropsUserKeys) {
    config.setBool(ConfigKeys::DEVELOPER_MODE, true);
    config.setString(ConfigKeys::OPZ_MOUNT_PATH, "/manual/opz");
    config.resetToDefaults();

    EXPECT_FALSE(config.developerMode());
    EXPECT_FALSE(config.contains(ConfigKeys::OPZ_MOUNT_PATH));
}

} // namespace testing
} // namespace sampler_monitor
