#pragma once
#include <sampler-monitor/Types.hpp>
#include <QJsonObject>
#include <string>
#include <vector>

namespace sampler_monitor {

struct DeviceKind;
class DeviceCatalog;
class StatusRegistry;

// {connected, path, usb_detected, mode}; path and mode are null when unset.
QJsonObject statusToJson(const DeviceStatus& status);

// Body of a device_status event (without "type").
QJsonObject statusEventPayload(const DeviceKind& kind, const DeviceStatus& status);

// {"<kind>": {connected, path, usb_detected, mode, device_name}, ...}
QJsonObject statusMapToJson(const DeviceCatalog& catalog, const StatusRegistry& registry);

// One serialized device_status event per catalog kind, in catalog order.
std::vector<std::string> statusSnapshotEvents(const DeviceCatalog& catalog,
                                              const StatusRegistry& registry);

}
