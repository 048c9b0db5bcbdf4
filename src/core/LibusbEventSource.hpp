#pragma once
#include "UsbEventSource.hpp"
#include <memory>
#include <string>

struct libusb_context;
struct libusb_device;

namespace sampler_monitor {

// Hot-plug notifications through libusb. Where libusb has no hot-plug
// capability the device list is diffed every USB_POLLING_INTERVAL instead.
class LibusbEventSource : public UsbEventSource {
public:
    // nullptr when libusb cannot be initialised on this host.
    static std::unique_ptr<LibusbEventSource> create();

    ~LibusbEventSource() override;

    std::vector<UsbDeviceInfo> enumerate() override;
    bool startMonitoring(Callback onConnect, Callback onDisconnect) override;
    void stopMonitoring() override;
    bool isAvailable() const override;

    bool hotplugSupported() const;

private:
    explicit LibusbEventSource(libusb_context* context);

    void handleDeviceArrival(libusb_device* device);
    void handleDeviceRemoval(libusb_device* device);
    void pollDevices();
    UsbDeviceInfo describeDevice(libusb_device* device) const;
    static std::string getDeviceIdentifier(libusb_device* device);

    class Private;
    std::unique_ptr<Private> d;
};

}
