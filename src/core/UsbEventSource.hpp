#pragma once
#include <sampler-monitor/Types.hpp>
#include <functional>
#include <memory>
#include <vector>

namespace sampler_monitor {

// Platform source of USB presence information.
class UsbEventSource {
public:
    using Callback = std::function<void(const UsbDeviceInfo&)>;

    virtual ~UsbEventSource() = default;

    // Devices present right now.
    virtual std::vector<UsbDeviceInfo> enumerate() = 0;
    // Returns false when hot-plug notifications cannot be delivered.
    virtual bool startMonitoring(Callback onConnect, Callback onDisconnect) = 0;
    virtual void stopMonitoring() = 0;
    virtual bool isAvailable() const = 0;
};

// Selected when no USB backend can be loaded: nothing is ever reported.
class NullUsbEventSource : public UsbEventSource {
public:
    std::vector<UsbDeviceInfo> enumerate() override { return {}; }
    bool startMonitoring(Callback, Callback) override { return false; }
    void stopMonitoring() override {}
    bool isAvailable() const override { return false; }
};

// libusb backed source, or the null source if libusb cannot be initialised.
std::unique_ptr<UsbEventSource> createPlatformUsbEventSource();

}
