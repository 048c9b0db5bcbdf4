#include "DeviceMonitor.hpp"
#include "DeviceCatalog.hpp"
#include "EventBroadcaster.hpp"
#include "Logger.hpp"
#include "MountResolver.hpp"
#include "StatusEvents.hpp"
#include "StatusRegistry.hpp"
#include "UsbEventSource.hpp"
#include "UsbIdentifier.hpp"
#include "../utils/ConfigManager.hpp"
#include <condition_variable>
#include <map>
#include <mutex>
#include <vector>

namespace sampler_monitor {

namespace {

DeviceStatus makeStatus(bool connected,
                        std::optional<std::string> path,
                        bool usbDetected,
                        DeviceMode mode) {
    DeviceStatus status;
    status.connected = connected;
    status.path = std::move(path);
    status.usbDetected = usbDetected;
    status.mode = mode;
    return status;
}

std::string describeStatus(const DeviceStatus& status) {
    return "connected=" + std::string(status.connected ? "true" : "false") +
           ", path=" + status.path.value_or("none") +
           ", mode=" + modeName(status.mode).value_or("none");
}

} // namespace

class DeviceMonitor::Private {
public:
    const DeviceCatalog& catalog;
    StatusRegistry& registry;
    EventBroadcaster& broadcaster;
    ConfigManager& config;
    const MountLocator& locator;
    std::unique_ptr<UsbEventSource> usbSource;
    MonitorSettings settings;

    // Serializes store + broadcast so events of one kind leave in order
    std::mutex dispatchMutex;

    std::map<std::string, std::shared_ptr<PollTask>> polls;
    mutable std::mutex pollsMutex;

    std::mutex lifecycleMutex;
    std::condition_variable stopCondition;
    bool stopping{false};
    bool initialized{false};
    bool monitoring{false};
    bool unavailableLogged{false};

    Private(const DeviceCatalog& catalog,
            StatusRegistry& registry,
            EventBroadcaster& broadcaster,
            ConfigManager& config,
            const MountLocator& locator)
        : catalog(catalog)
        , registry(registry)
        , broadcaster(broadcaster)
        , config(config)
        , locator(locator) {
    }

    struct Identified {
        int vendorId;
        int productId;
    };

    std::optional<Identified> identify(const UsbDeviceInfo& info) const {
        auto vendor = normalizeUsbId(info.vendorId);
        auto product = normalizeUsbId(info.productId);
        if (!vendor || !product) {
            LOG_DEBUG("Ignoring USB device " + info.deviceId + " with unreadable ids vendor=" +
                      formatUsbId(info.vendorId) + " product=" + formatUsbId(info.productId));
            return std::nullopt;
        }
        return Identified{*vendor, *product};
    }

    bool knownVendor(int vendorId) const {
        for (const auto& kind : catalog.all()) {
            if (kind.vendorId == vendorId) {
                return true;
            }
        }
        return false;
    }
};

DeviceMonitor::DeviceMonitor(const DeviceCatalog& catalog,
                             StatusRegistry& registry,
                             EventBroadcaster& broadcaster,
                             ConfigManager& config,
                             const MountLocator& locator,
                             std::unique_ptr<UsbEventSource> usbSource,
                             MonitorSettings settings,
                             QObject* parent)
    : QObject(parent)
    , d(std::make_unique<Private>(catalog, registry, broadcaster, config, locator)) {
    d->usbSource = usbSource ? std::move(usbSource) : std::make_unique<NullUsbEventSource>();
    d->settings = settings;
}

DeviceMonitor::~DeviceMonitor() {
    stopMonitoring();
}

void DeviceMonitor::initialize() {
    {
        std::lock_guard<std::mutex> lock(d->lifecycleMutex);
        if (d->initialized) {
            return;
        }
        d->initialized = true;
    }

    LOG_INFO("Initializing device monitor...");
    scanConnectedDevices();
    startMonitoring();
}

bool DeviceMonitor::isInitialized() const {
    std::lock_guard<std::mutex> lock(d->lifecycleMutex);
    return d->initialized;
}

void DeviceMonitor::scanConnectedDevices() {
    LOG_INFO("Scanning for connected devices...");

    for (const auto& kind : d->catalog.all()) {
        MountResult mount = d->locator.findMount(kind);
        LOG_INFO("  " + kind.id + ": mount_path=" + mount.path.value_or("none") +
                 ", mode=" + modeName(mount.mode).value_or("none"));
        if (mount.found()) {
            applyStatus(kind.id, makeStatus(true, mount.path, true, mount.mode));
        }
    }

    try {
        for (const auto& info : d->usbSource->enumerate()) {
            auto ids = d->identify(info);
            if (!ids) {
                continue;
            }
            auto classified = d->catalog.classify(ids->vendorId, ids->productId, info.usbClass);
            if (!classified) {
                continue;
            }

            const DeviceKind& kind = *classified->kind;
            if (d->registry.read(kind.id).connected) {
                continue;
            }

            if (classified->role == ConnectionRole::Other) {
                LOG_INFO("Found " + kind.name + " in normal mode on startup");
                applyStatus(kind.id, makeStatus(true, std::nullopt, true, DeviceMode::Other));
            } else if (classified->role == ConnectionRole::PendingStorage) {
                LOG_INFO("Found " + kind.name + " in standby mode on startup (connected but off)");
                applyStatus(kind.id, makeStatus(true, std::nullopt, true, DeviceMode::Standby));
            }
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Error scanning for USB devices: " + std::string(e.what()));
    }
}

bool DeviceMonitor::startMonitoring() {
    std::lock_guard<std::mutex> lock(d->lifecycleMutex);
    if (d->monitoring) {
        return true;
    }
    d->stopping = false;

    bool started = d->usbSource->isAvailable() && d->usbSource->startMonitoring(
        [this](const UsbDeviceInfo& info) { handleConnect(info); },
        [this](const UsbDeviceInfo& info) { handleDisconnect(info); });

    if (!started) {
        if (!d->unavailableLogged) {
            LOG_WARNING("USB hot-plug monitoring unavailable; device status refreshes on demand only");
            d->unavailableLogged = true;
        }
        return false;
    }

    d->monitoring = true;
    return true;
}

void DeviceMonitor::stopMonitoring() {
    {
        std::lock_guard<std::mutex> lock(d->lifecycleMutex);
        d->stopping = true;
    }
    d->stopCondition.notify_all();

    d->usbSource->stopMonitoring();

    std::map<std::string, std::shared_ptr<PollTask>> polls;
    {
        std::lock_guard<std::mutex> lock(d->pollsMutex);
        polls.swap(d->polls);
    }
    for (auto& [kind, task] : polls) {
        task->cancel();
    }
    polls.clear();

    std::lock_guard<std::mutex> lock(d->lifecycleMutex);
    d->monitoring = false;
}

bool DeviceMonitor::isMonitoring() const {
    std::lock_guard<std::mutex> lock(d->lifecycleMutex);
    return d->monitoring;
}

void DeviceMonitor::handleConnect(const UsbDeviceInfo& info) {
    try {
        processConnect(info);
    } catch (const std::exception& e) {
        LOG_ERROR("Error handling USB connect of " + info.deviceId + ": " + std::string(e.what()));
    } catch (...) {
        LOG_ERROR("Unknown error handling USB connect of " + info.deviceId);
    }
}

void DeviceMonitor::handleDisconnect(const UsbDeviceInfo& info) {
    try {
        processDisconnect(info);
    } catch (const std::exception& e) {
        LOG_ERROR("Error handling USB disconnect of " + info.deviceId + ": " + std::string(e.what()));
    } catch (...) {
        LOG_ERROR("Unknown error handling USB disconnect of " + info.deviceId);
    }
}

void DeviceMonitor::processConnect(const UsbDeviceInfo& info) {
    LOG_DEBUG("USB connect - device_id: " + info.deviceId +
              ", vendor: " + formatUsbId(info.vendorId) +
              ", product: " + formatUsbId(info.productId) +
              ", class: " + info.usbClass);

    auto ids = d->identify(info);
    if (!ids) {
        return;
    }

    auto classified = d->catalog.classify(ids->vendorId, ids->productId, info.usbClass);
    if (!classified) {
        if (d->knownVendor(ids->vendorId)) {
            LOG_WARNING("Unknown product id " + std::to_string(ids->productId) +
                        " for vendor " + std::to_string(ids->vendorId));
        } else {
            LOG_DEBUG("Ignoring USB device " + info.deviceId + " from vendor " +
                      std::to_string(ids->vendorId));
        }
        return;
    }

    const DeviceKind& kind = *classified->kind;
    if (classified->role == ConnectionRole::Other) {
        LOG_INFO(kind.name + " connected in non-storage mode");
        applyStatus(kind.id, makeStatus(true, std::nullopt, true, DeviceMode::Other));
        return;
    }

    LOG_INFO("Detected " + kind.name + " in storage-capable mode");
    resolveStorage(kind, classified->role);
}

void DeviceMonitor::resolveStorage(const DeviceKind& kind, ConnectionRole role) {
    // The volume usually mounts a moment after enumeration
    if (!waitForSettle()) {
        return;
    }

    MountResult mount = d->locator.findMount(kind);
    if (mount.found()) {
        LOG_INFO("Found mount path: " + *mount.path + " (mode: " +
                 modeName(mount.mode).value_or("none") + ")");
        applyStatus(kind.id, makeStatus(true, mount.path, true, mount.mode));
        return;
    }

    if (role == ConnectionRole::PendingStorage) {
        LOG_INFO("No mount path for " + kind.id + ", device appears to be in standby mode");
        applyStatus(kind.id, makeStatus(true, std::nullopt, true, DeviceMode::Standby));
    } else {
        LOG_INFO("Mount path not found for " + kind.id + ", starting background polling...");
        applyStatus(kind.id, makeStatus(true, std::nullopt, true, DeviceMode::None));
    }
    startPolling(kind);
}

void DeviceMonitor::processDisconnect(const UsbDeviceInfo& info) {
    LOG_DEBUG("USB disconnect - device_id: " + info.deviceId +
              ", vendor: " + formatUsbId(info.vendorId) +
              ", product: " + formatUsbId(info.productId));

    auto ids = d->identify(info);
    if (!ids) {
        return;
    }

    const DeviceKind* kind = d->catalog.findByIds(ids->vendorId, ids->productId);
    if (!kind) {
        if (d->knownVendor(ids->vendorId)) {
            LOG_WARNING("Unknown product id " + std::to_string(ids->productId) +
                        " for vendor " + std::to_string(ids->vendorId));
        }
        return;
    }

    LOG_INFO("Disconnected " + kind->name);
    cancelPolling(kind->id);
    applyStatus(kind->id, makeStatus(false, std::nullopt, false, DeviceMode::None));
}

bool DeviceMonitor::applyStatus(const std::string& kind, const DeviceStatus& status) {
    const DeviceKind* deviceKind = d->catalog.find(kind);
    if (!deviceKind) {
        LOG_WARNING("Status update for unknown device kind " + kind);
        return false;
    }

    DeviceStatus stored;
    {
        std::lock_guard<std::mutex> lock(d->dispatchMutex);
        if (!d->registry.update(kind, status)) {
            return false;
        }
        stored = d->registry.read(kind);

        LOG_INFO("Broadcasting " + deviceKind->name + " " + describeStatus(stored));
        d->broadcaster.publish(EventTypes::DEVICE_STATUS, statusEventPayload(*deviceKind, stored));
    }

    mirrorToConfig(*deviceKind, stored);
    emit deviceStatusChanged(kind);
    return true;
}

void DeviceMonitor::mirrorToConfig(const DeviceKind& kind, const DeviceStatus& status) {
    // In developer mode the manually chosen path is authoritative
    if (d->config.developerMode()) {
        return;
    }

    if (status.connected && status.path && status.mode == DeviceMode::Storage) {
        d->config.setString(kind.detectedPathKey, *status.path);
    } else if (!status.connected) {
        d->config.setString(kind.detectedPathKey, "");
    }
}

std::shared_ptr<Subscriber> DeviceMonitor::openEventStream() {
    return d->broadcaster.subscribe([this] {
        return statusSnapshotEvents(d->catalog, d->registry);
    });
}

void DeviceMonitor::closeEventStream(const std::shared_ptr<Subscriber>& subscriber) {
    d->broadcaster.unsubscribe(subscriber);
}

void DeviceMonitor::startPolling(const DeviceKind& kind) {
    std::lock_guard<std::mutex> lock(d->pollsMutex);

    auto it = d->polls.find(kind.id);
    if (it != d->polls.end() && it->second->isRunning()) {
        LOG_DEBUG("Mount polling for " + kind.id + " already running");
        return;
    }

    const std::string id = kind.id;
    auto task = std::make_shared<PollTask>(
        id,
        d->settings.poll,
        [this, id] {
            DeviceStatus status = d->registry.read(id);
            return status.connected && !status.path;
        },
        [this, &kind](int) {
            MountResult mount = d->locator.findMount(kind);
            if (!mount.found()) {
                return false;
            }
            applyStatus(kind.id, makeStatus(true, mount.path, true, mount.mode));
            return true;
        });
    task->start();

    // Replacing a finished task joins its thread
    d->polls[id] = std::move(task);
}

void DeviceMonitor::cancelPolling(const std::string& kind) {
    std::shared_ptr<PollTask> task;
    {
        std::lock_guard<std::mutex> lock(d->pollsMutex);
        auto it = d->polls.find(kind);
        if (it == d->polls.end()) {
            return;
        }
        task = std::move(it->second);
        d->polls.erase(it);
    }
    task->cancel();
    task->wait();
}

bool DeviceMonitor::isPolling(const std::string& kind) const {
    std::lock_guard<std::mutex> lock(d->pollsMutex);
    auto it = d->polls.find(kind);
    return it != d->polls.end() && it->second->isRunning();
}

void DeviceMonitor::waitForPolls() {
    std::vector<std::shared_ptr<PollTask>> tasks;
    {
        std::lock_guard<std::mutex> lock(d->pollsMutex);
        for (auto& [kind, task] : d->polls) {
            tasks.push_back(task);
        }
    }
    for (auto& task : tasks) {
        task->wait();
    }
}

bool DeviceMonitor::waitForSettle() {
    if (d->settings.mountSettleDelay.count() <= 0) {
        return true;
    }
    std::unique_lock<std::mutex> lock(d->lifecycleMutex);
    return !d->stopCondition.wait_for(lock, d->settings.mountSettleDelay,
                                      [this] { return d->stopping; });
}

const DeviceCatalog& DeviceMonitor::catalog() const {
    return d->catalog;
}

const StatusRegistry& DeviceMonitor::registry() const {
    return d->registry;
}

const ConfigManager& DeviceMonitor::config() const {
    return d->config;
}

}
