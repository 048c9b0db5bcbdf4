#pragma once
#include "PollTask.hpp"
#include <sampler-monitor/Constants.hpp>
#include <sampler-monitor/Types.hpp>
#include <QObject>
#include <chrono>
#include <memory>
#include <string>

namespace sampler_monitor {

struct DeviceKind;
class DeviceCatalog;
class StatusRegistry;
class EventBroadcaster;
class Subscriber;
class MountLocator;
class UsbEventSource;
class ConfigManager;

struct MonitorSettings {
    PollSettings poll{POLL_MAX_ATTEMPTS, std::chrono::milliseconds(POLL_INTERVAL)};
    // Wait between a storage-mode connect and the first mount lookup
    std::chrono::milliseconds mountSettleDelay{MOUNT_SETTLE_DELAY};
};

// Tracks presence and mount state of every catalog device.
//
// USB notifications are classified against the catalog, storage-capable
// connects are resolved to a mount path (immediately, then by a PollTask),
// and every real status change is broadcast to stream subscribers and
// mirrored into the configuration unless developer mode is on.
class DeviceMonitor : public QObject {
    Q_OBJECT

public:
    DeviceMonitor(const DeviceCatalog& catalog,
                  StatusRegistry& registry,
                  EventBroadcaster& broadcaster,
                  ConfigManager& config,
                  const MountLocator& locator,
                  std::unique_ptr<UsbEventSource> usbSource,
                  MonitorSettings settings = MonitorSettings{},
                  QObject* parent = nullptr);
    ~DeviceMonitor() override;

    // Startup scan followed by hot-plug monitoring; runs once.
    void initialize();
    bool isInitialized() const;

    // Mount scan for every kind, then the USB device list for devices in
    // MIDI or standby mode.
    void scanConnectedDevices();

    bool startMonitoring();
    void stopMonitoring();
    bool isMonitoring() const;

    // USB notification entry points; never throw.
    void handleConnect(const UsbDeviceInfo& info);
    void handleDisconnect(const UsbDeviceInfo& info);

    // Stores the status and, if it changed, broadcasts it and updates the
    // configuration. Returns whether anything changed.
    bool applyStatus(const std::string& kind, const DeviceStatus& status);

    // A subscriber that first receives the current status of every kind.
    std::shared_ptr<Subscriber> openEventStream();
    void closeEventStream(const std::shared_ptr<Subscriber>& subscriber);

    bool isPolling(const std::string& kind) const;
    void waitForPolls();

    const DeviceCatalog& catalog() const;
    const StatusRegistry& registry() const;
    const ConfigManager& config() const;

signals:
    void deviceStatusChanged(const std::string& kind);

private:
    void processConnect(const UsbDeviceInfo& info);
    void processDisconnect(const UsbDeviceInfo& info);
    void resolveStorage(const DeviceKind& kind, ConnectionRole role);
    void startPolling(const DeviceKind& kind);
    void cancelPolling(const std::string& kind);
    void mirrorToConfig(const DeviceKind& kind, const DeviceStatus& status);
    bool waitForSettle();

    class Private;
    std::unique_ptr<Private> d;
};

}
