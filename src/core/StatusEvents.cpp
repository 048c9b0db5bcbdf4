#include "StatusEvents.hpp"
#include "DeviceCatalog.hpp"
#include "EventBroadcaster.hpp"
#include "StatusRegistry.hpp"
#include <sampler-monitor/Constants.hpp>
#include <QJsonValue>

namespace sampler_monitor {

QJsonObject statusToJson(const DeviceStatus& status) {
    QJsonObject json;
    json.insert(QStringLiteral("connected"), status.connected);
    json.insert(QStringLiteral("path"), status.path
        ? QJsonValue(QString::fromStdString(*status.path))
        : QJsonValue(QJsonValue::Null));
    json.insert(QStringLiteral("usb_detected"), status.usbDetected);

    auto mode = modeName(status.mode);
    json.insert(QStringLiteral("mode"), mode
        ? QJsonValue(QString::fromStdString(*mode))
        : QJsonValue(QJsonValue::Null));
    return json;
}

QJsonObject statusEventPayload(const DeviceKind& kind, const DeviceStatus& status) {
    QJsonObject json = statusToJson(status);
    json.insert(QStringLiteral("device"), QString::fromStdString(kind.id));
    json.insert(QStringLiteral("device_name"), QString::fromStdString(kind.name));
    return json;
}

QJsonObject statusMapToJson(const DeviceCatalog& catalog, const StatusRegistry& registry) {
    const auto statuses = registry.readAll();

    QJsonObject json;
    for (const auto& kind : catalog.all()) {
        auto it = statuses.find(kind.id);
        QJsonObject entry = statusToJson(it != statuses.end() ? it->second : DeviceStatus{});
        entry.insert(QStringLiteral("device_name"), QString::fromStdString(kind.name));
        json.insert(QString::fromStdString(kind.id), entry);
    }
    return json;
}

std::vector<std::string> statusSnapshotEvents(const DeviceCatalog& catalog,
                                              const StatusRegistry& registry) {
    const auto statuses = registry.readAll();

    std::vector<std::string> events;
    for (const auto& kind : catalog.all()) {
        auto it = statuses.find(kind.id);
        events.push_back(EventBroadcaster::serializeEvent(
            EventTypes::DEVICE_STATUS,
            statusEventPayload(kind, it != statuses.end() ? it->second : DeviceStatus{})));
    }
    return events;
}

}
