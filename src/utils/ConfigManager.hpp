#pragma once
#include <QObject>
#include <memory>
#include <string>
#include <variant>
#include <map>

namespace sampler_monitor {

struct DeviceKind;

using ConfigValue = std::variant<bool, int, double, std::string>;

// Flat key/value application settings persisted as a JSON object. Safe to
// use from any thread; configChanged is emitted on the calling thread.
class ConfigManager : public QObject {
    Q_OBJECT

public:
    explicit ConfigManager(QObject* parent = nullptr);
    ~ConfigManager();

    bool getBool(const std::string& key, bool defaultValue = false) const;
    int getInt(const std::string& key, int defaultValue = 0) const;
    double getDouble(const std::string& key, double defaultValue = 0.0) const;
    // An empty stored string yields the default when one is given.
    std::string getString(const std::string& key, const std::string& defaultValue = "") const;
    bool contains(const std::string& key) const;

    void setBool(const std::string& key, bool value);
    void setInt(const std::string& key, int value);
    void setDouble(const std::string& key, double value);
    void setString(const std::string& key, const std::string& value);

    // Manual path in developer mode, auto-detected path otherwise.
    std::string effectiveMountPath(const DeviceKind& kind) const;
    bool developerMode() const;

    // File operations. After loadFromFile or setStorageFile every set*
    // call writes the file back.
    bool loadFromFile(const std::string& filename);
    bool saveToFile(const std::string& filename) const;
    void setStorageFile(const std::string& filename);
    std::string storageFile() const;

    static std::string defaultConfigPath();

    void resetToDefaults();

signals:
    void configChanged(const std::string& key);

private:
    void setValue(const std::string& key, ConfigValue value);

    class Private;
    std::unique_ptr<Private> d;
};

}
