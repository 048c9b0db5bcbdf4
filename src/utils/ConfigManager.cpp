#include "ConfigManager.hpp"
#include "../core/DeviceCatalog.hpp"
#include "../core/Logger.hpp"
#include <sampler-monitor/Constants.hpp>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonValue>
#include <QSaveFile>
#include <QStandardPaths>
#include <climits>
#include <cmath>
#include <mutex>
#include <optional>
#include <vector>

namespace sampler_monitor {

template<class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template<class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

class ConfigManager::Private {
public:
    std::map<std::string, ConfigValue> settings;
    std::string storageFile;
    mutable std::mutex configMutex;

    QJsonValue toJsonValue(const ConfigValue& value) const {
        return std::visit(overloaded{
            [](bool b) -> QJsonValue { return b; },
            [](int i) -> QJsonValue { return i; },
            [](double d) -> QJsonValue { return d; },
            [](const std::string& s) -> QJsonValue { return QString::fromStdString(s); }
        }, value);
    }

    std::optional<ConfigValue> fromJsonValue(const QJsonValue& json) const {
        switch (json.type()) {
            case QJsonValue::Bool:
                return ConfigValue{json.toBool()};
            case QJsonValue::Double: {
                double number = json.toDouble();
                double whole = 0.0;
                if (std::modf(number, &whole) == 0.0 &&
                    whole >= INT_MIN && whole <= INT_MAX) {
                    return ConfigValue{static_cast<int>(whole)};
                }
                return ConfigValue{number};
            }
            case QJsonValue::String:
                return ConfigValue{json.toString().toStdString()};
            default:
                return std::nullopt;
        }
    }

    void setDefaults() {
        settings = {
            {ConfigKeys::DEVELOPER_MODE, false}
        };
    }

    template<typename T>
    const T* find(const std::string& key) const {
        auto it = settings.find(key);
        if (it != settings.end()) {
            return std::get_if<T>(&it->second);
        }
        return nullptr;
    }

    bool writeFile(const std::string& filename) const {
        QJsonObject root;
        for (const auto& [key, value] : settings) {
            root[QString::fromStdString(key)] = toJsonValue(value);
        }

        QFileInfo info(QString::fromStdString(filename));
        QDir().mkpath(info.absolutePath());

        QSaveFile file(info.absoluteFilePath());
        if (!file.open(QIODevice::WriteOnly)) {
            return false;
        }
        file.write(QJsonDocument(root).toJson());
        return file.commit();
    }
};

ConfigManager::ConfigManager(QObject* parent)
    : QObject(parent)
    , d(std::make_unique<Private>()) {
    d->setDefaults();
}

ConfigManager::~ConfigManager() = default;

bool ConfigManager::getBool(const std::string& key, bool defaultValue) const {
    std::lock_guard<std::mutex> lock(d->configMutex);
    if (auto value = d->find<bool>(key)) {
        return *value;
    }
    return defaultValue;
}

int ConfigManager::getInt(const std::string& key, int defaultValue) const {
    std::lock_guard<std::mutex> lock(d->configMutex);
    if (auto value = d->find<int>(key)) {
        return *value;
    }
    return defaultValue;
}

double ConfigManager::getDouble(const std::string& key, double defaultValue) const {
    std::lock_guard<std::mutex> lock(d->configMutex);
    if (auto value = d->find<double>(key)) {
        return *value;
    }
    if (auto value = d->find<int>(key)) {
        return *value;
    }
    return defaultValue;
}

std::string ConfigManager::getString(const std::string& key, const std::string& defaultValue) const {
    std::lock_guard<std::mutex> lock(d->configMutex);
    if (auto value = d->find<std::string>(key)) {
        if (value->empty() && !defaultValue.empty()) {
            return defaultValue;
        }
        return *value;
    }
    return defaultValue;
}

bool ConfigManager::contains(const std::string& key) const {
    std::lock_guard<std::mutex> lock(d->configMutex);
    return d->settings.count(key) > 0;
}

void ConfigManager::setBool(const std::string& key, bool value) {
    setValue(key, value);
}

void ConfigManager::setInt(const std::string& key, int value) {
    setValue(key, value);
}

void ConfigManager::setDouble(const std::string& key, double value) {
    setValue(key, value);
}

void ConfigManager::setString(const std::string& key, const std::string& value) {
    setValue(key, value);
}

void ConfigManager::setValue(const std::string& key, ConfigValue value) {
    {
        std::lock_guard<std::mutex> lock(d->configMutex);
        d->settings[key] = std::move(value);
        if (!d->storageFile.empty() && !d->writeFile(d->storageFile)) {
            LOG_ERROR("Failed to save configuration to " + d->storageFile);
        }
    }
    emit configChanged(key);
}

bool ConfigManager::developerMode() const {
    return getBool(ConfigKeys::DEVELOPER_MODE, false);
}

std::string ConfigManager::effectiveMountPath(const DeviceKind& kind) const {
    const std::string& key = developerMode() ? kind.manualPathKey : kind.detectedPathKey;
    return getString(key, "");
}

bool ConfigManager::loadFromFile(const std::string& filename) {
    QFile file(QString::fromStdString(filename));
    if (!file.open(QIODevice::ReadOnly)) {
        return false;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (doc.isNull() || !doc.isObject()) {
        LOG_WARNING("Invalid configuration file " + filename + ": " +
                    parseError.errorString().toStdString());
        return false;
    }

    std::vector<std::string> changed;
    {
        std::lock_guard<std::mutex> lock(d->configMutex);
        const QJsonObject root = doc.object();
        for (auto it = root.begin(); it != root.end(); ++it) {
            std::string key = it.key().toStdString();
            if (auto value = d->fromJsonValue(it.value())) {
                d->settings[key] = *value;
                changed.push_back(key);
            }
        }
        d->storageFile = filename;
    }

    for (const auto& key : changed) {
        emit configChanged(key);
    }
    return true;
}

bool ConfigManager::saveToFile(const std::string& filename) const {
    std::lock_guard<std::mutex> lock(d->configMutex);
    return d->writeFile(filename);
}

void ConfigManager::setStorageFile(const std::string& filename) {
    std::lock_guard<std::mutex> lock(d->configMutex);
    d->storageFile = filename;
}

std::string ConfigManager::storageFile() const {
    std::lock_guard<std::mutex> lock(d->configMutex);
    return d->storageFile;
}

std::string ConfigManager::defaultConfigPath() {
    QString base = QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation);
    return QDir(base).filePath(QStringLiteral("OP-1Z Sample Manager/op-1z_sm_config.json"))
        .toStdString();
}

void ConfigManager::resetToDefaults() {
    std::vector<std::string> keys;
    {
        std::lock_guard<std::mutex> lock(d->configMutex);
        for (const auto& [key, _] : d->settings) {
            keys.push_back(key);
        }
        d->setDefaults();
        if (!d->storageFile.empty() && !d->writeFile(d->storageFile)) {
            LOG_ERROR("Failed to save configuration to " + d->storageFile);
        }
    }

    for (const auto& key : keys) {
        emit configChanged(key);
    }
}

}
