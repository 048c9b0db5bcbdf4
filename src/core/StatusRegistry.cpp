#include "StatusRegistry.hpp"
#include "DeviceCatalog.hpp"
#include <mutex>

namespace sampler_monitor {

class StatusRegistry::Private {
public:
    std::vector<std::string> order;
    std::map<std::string, DeviceStatus> statuses;
    mutable std::mutex statusMutex;

    static DeviceStatus normalized(DeviceStatus status) {
        if (status.path && status.path->empty()) {
            status.path.reset();
        }
        if (!isMountedMode(status.mode)) {
            status.path.reset();
        } else if (!status.path) {
            status.mode = DeviceMode::None;
        }
        return status;
    }
};

StatusRegistry::StatusRegistry(const DeviceCatalog& catalog)
    : d(std::make_unique<Private>()) {
    for (const auto& kind : catalog.all()) {
        d->order.push_back(kind.id);
        d->statuses[kind.id] = DeviceStatus{};
    }
}

StatusRegistry::~StatusRegistry() = default;

bool StatusRegistry::update(const std::string& kind,
                            bool connected,
                            std::optional<std::string> path,
                            bool usbDetected,
                            DeviceMode mode) {
    DeviceStatus status;
    status.connected = connected;
    status.path = std::move(path);
    status.usbDetected = usbDetected;
    status.mode = mode;
    return update(kind, status);
}

bool StatusRegistry::update(const std::string& kind, const DeviceStatus& status) {
    DeviceStatus next = Private::normalized(status);

    std::lock_guard<std::mutex> lock(d->statusMutex);
    auto it = d->statuses.find(kind);
    if (it == d->statuses.end()) {
        return false;
    }
    if (it->second == next) {
        return false;
    }
    it->second = std::move(next);
    return true;
}

DeviceStatus StatusRegistry::read(const std::string& kind) const {
    std::lock_guard<std::mutex> lock(d->statusMutex);
    auto it = d->statuses.find(kind);
    if (it != d->statuses.end()) {
        return it->second;
    }
    return DeviceStatus{};
}

std::map<std::string, DeviceStatus> StatusRegistry::readAll() const {
    std::lock_guard<std::mutex> lock(d->statusMutex);
    return d->statuses;
}

bool StatusRegistry::contains(const std::string& kind) const {
    std::lock_guard<std::mutex> lock(d->statusMutex);
    return d->statuses.count(kind) > 0;
}

std::vector<std::string> StatusRegistry::kinds() const {
    // Fixed at construction, no lock needed
    return d->order;
}

}
