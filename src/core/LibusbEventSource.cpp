#include "LibusbEventSource.hpp"
#include "Logger.hpp"
#include <sampler-monitor/Constants.hpp>
#include <libusb-1.0/libusb.h>
#include <atomic>
#include <condition_variable>
#include <iomanip>
#include <map>
#include <mutex>
#include <sstream>
#include <thread>

namespace sampler_monitor {

class LibusbEventSource::Private {
public:
    libusb_context* context{nullptr};
    bool hotplugSupported{false};
    bool hotplugRegistered{false};
    libusb_hotplug_callback_handle hotplugHandle{};

    Callback onConnect;
    Callback onDisconnect;

    // Devices seen so far, by bus identifier. Removal events only carry the
    // descriptor, the USB class is remembered from arrival.
    std::map<std::string, UsbDeviceInfo> devices;
    std::mutex devicesMutex;

    std::thread worker;
    std::atomic<bool> running{false};
    std::mutex wakeMutex;
    std::condition_variable wakeup;

    static int LIBUSB_CALL hotplugCallback(libusb_context*,
                                           libusb_device* device,
                                           libusb_hotplug_event event,
                                           void* user_data) {
        auto source = static_cast<LibusbEventSource*>(user_data);
        try {
            if (event == LIBUSB_HOTPLUG_EVENT_DEVICE_ARRIVED) {
                source->handleDeviceArrival(device);
            } else if (event == LIBUSB_HOTPLUG_EVENT_DEVICE_LEFT) {
                source->handleDeviceRemoval(device);
            }
        } catch (const std::exception& e) {
            LOG_ERROR("USB hotplug callback failed: " + std::string(e.what()));
        }
        return 0;
    }

    static std::string usbClassOf(libusb_device* device, const libusb_device_descriptor& desc) {
        if (desc.bDeviceClass == LIBUSB_CLASS_AUDIO) {
            return UsbClass::MEDIA;
        }
        if (desc.bDeviceClass == LIBUSB_CLASS_MASS_STORAGE) {
            return UsbClass::STORAGE;
        }

        libusb_config_descriptor* config = nullptr;
        if (libusb_get_active_config_descriptor(device, &config) != LIBUSB_SUCCESS &&
            libusb_get_config_descriptor(device, 0, &config) != LIBUSB_SUCCESS) {
            return {};
        }

        bool audio = false;
        bool storage = false;
        for (int i = 0; i < config->bNumInterfaces; i++) {
            const libusb_interface* interface = &config->interface[i];
            for (int j = 0; j < interface->num_altsetting; j++) {
                uint8_t cls = interface->altsetting[j].bInterfaceClass;
                audio = audio || cls == LIBUSB_CLASS_AUDIO;
                storage = storage || cls == LIBUSB_CLASS_MASS_STORAGE;
            }
        }
        libusb_free_config_descriptor(config);

        if (audio) return UsbClass::MEDIA;
        if (storage) return UsbClass::STORAGE;
        return {};
    }
};

std::unique_ptr<LibusbEventSource> LibusbEventSource::create() {
    libusb_context* context = nullptr;
    int ret = libusb_init(&context);
    if (ret != LIBUSB_SUCCESS) {
        LOG_WARNING("Failed to initialize libusb: " + std::string(libusb_error_name(ret)));
        return nullptr;
    }
    return std::unique_ptr<LibusbEventSource>(new LibusbEventSource(context));
}

LibusbEventSource::LibusbEventSource(libusb_context* context)
    : d(std::make_unique<Private>()) {
    d->context = context;
    d->hotplugSupported = libusb_has_capability(LIBUSB_CAP_HAS_HOTPLUG) != 0;
}

LibusbEventSource::~LibusbEventSource() {
    stopMonitoring();

    if (d->context) {
        libusb_exit(d->context);
        d->context = nullptr;
    }
}

bool LibusbEventSource::isAvailable() const {
    return d->context != nullptr;
}

bool LibusbEventSource::hotplugSupported() const {
    return d->hotplugSupported;
}

std::vector<UsbDeviceInfo> LibusbEventSource::enumerate() {
    std::vector<UsbDeviceInfo> result;

    libusb_device** list = nullptr;
    ssize_t count = libusb_get_device_list(d->context, &list);
    if (count < 0) {
        LOG_ERROR("Failed to get USB device list: " +
                  std::string(libusb_error_name(static_cast<int>(count))));
        return result;
    }

    result.reserve(static_cast<size_t>(count));
    for (ssize_t i = 0; i < count; i++) {
        result.push_back(describeDevice(list[i]));
    }

    libusb_free_device_list(list, 1);
    return result;
}

bool LibusbEventSource::startMonitoring(Callback onConnect, Callback onDisconnect) {
    if (d->running) {
        return true;
    }

    d->onConnect = std::move(onConnect);
    d->onDisconnect = std::move(onDisconnect);

    {
        std::lock_guard<std::mutex> lock(d->devicesMutex);
        d->devices.clear();
    }
    for (auto& info : enumerate()) {
        std::lock_guard<std::mutex> lock(d->devicesMutex);
        d->devices[info.deviceId] = info;
    }

    if (d->hotplugSupported) {
        int result = libusb_hotplug_register_callback(
            d->context,
            static_cast<libusb_hotplug_event>(
                LIBUSB_HOTPLUG_EVENT_DEVICE_ARRIVED |
                LIBUSB_HOTPLUG_EVENT_DEVICE_LEFT),
            static_cast<libusb_hotplug_flag>(0),
            LIBUSB_HOTPLUG_MATCH_ANY,
            LIBUSB_HOTPLUG_MATCH_ANY,
            LIBUSB_HOTPLUG_MATCH_ANY,
            Private::hotplugCallback,
            this,
            &d->hotplugHandle
        );

        if (result == LIBUSB_SUCCESS) {
            d->hotplugRegistered = true;
        } else {
            LOG_WARNING("libusb hotplug registration failed: " +
                        std::string(libusb_error_name(result)) + ", polling instead");
        }
    }

    d->running = true;
    if (d->hotplugRegistered) {
        d->worker = std::thread([this] {
            while (d->running) {
                timeval tv{0, USB_EVENT_TIMEOUT * 1000};
                int ret = libusb_handle_events_timeout_completed(d->context, &tv, nullptr);
                if (ret != LIBUSB_SUCCESS && ret != LIBUSB_ERROR_INTERRUPTED) {
                    LOG_ERROR("libusb event handling failed: " + std::string(libusb_error_name(ret)));
                    break;
                }
            }
        });
    } else {
        d->worker = std::thread([this] {
            while (d->running) {
                pollDevices();
                std::unique_lock<std::mutex> lock(d->wakeMutex);
                d->wakeup.wait_for(lock, std::chrono::milliseconds(USB_POLLING_INTERVAL),
                                   [this] { return !d->running; });
            }
        });
    }

    LOG_INFO(std::string("USB monitoring started (") +
             (d->hotplugRegistered ? "hotplug" : "polling") + ")");
    return true;
}

void LibusbEventSource::stopMonitoring() {
    if (!d->running.exchange(false)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(d->wakeMutex);
    }
    d->wakeup.notify_all();

    if (d->hotplugRegistered) {
        // Deregistering also interrupts a blocked libusb_handle_events call
        libusb_hotplug_deregister_callback(d->context, d->hotplugHandle);
        d->hotplugRegistered = false;
    }

    if (d->worker.joinable()) {
        d->worker.join();
    }

    LOG_INFO("USB monitoring stopped");
}

void LibusbEventSource::pollDevices() {
    std::map<std::string, UsbDeviceInfo> current;
    for (auto& info : enumerate()) {
        current[info.deviceId] = info;
    }

    std::vector<UsbDeviceInfo> arrived;
    std::vector<UsbDeviceInfo> left;
    {
        std::lock_guard<std::mutex> lock(d->devicesMutex);
        for (const auto& [id, info] : current) {
            if (d->devices.find(id) == d->devices.end()) {
                arrived.push_back(info);
            }
        }
        for (const auto& [id, info] : d->devices) {
            if (current.find(id) == current.end()) {
                left.push_back(info);
            }
        }
        d->devices = std::move(current);
    }

    for (const auto& info : left) {
        if (d->onDisconnect) d->onDisconnect(info);
    }
    for (const auto& info : arrived) {
        if (d->onConnect) d->onConnect(info);
    }
}

void LibusbEventSource::handleDeviceArrival(libusb_device* device) {
    UsbDeviceInfo info = describeDevice(device);
    {
        std::lock_guard<std::mutex> lock(d->devicesMutex);
        d->devices[info.deviceId] = info;
    }

    if (d->onConnect) {
        d->onConnect(info);
    }
}

void LibusbEventSource::handleDeviceRemoval(libusb_device* device) {
    std::string id = getDeviceIdentifier(device);

    UsbDeviceInfo info;
    {
        std::lock_guard<std::mutex> lock(d->devicesMutex);
        auto it = d->devices.find(id);
        if (it != d->devices.end()) {
            info = it->second;
            d->devices.erase(it);
        }
    }
    if (info.deviceId.empty()) {
        info = describeDevice(device);
    }

    if (d->onDisconnect) {
        d->onDisconnect(info);
    }
}

UsbDeviceInfo LibusbEventSource::describeDevice(libusb_device* device) const {
    UsbDeviceInfo info;
    info.deviceId = getDeviceIdentifier(device);

    libusb_device_descriptor desc;
    if (libusb_get_device_descriptor(device, &desc) == 0) {
        info.vendorId = static_cast<int>(desc.idVendor);
        info.productId = static_cast<int>(desc.idProduct);
        info.usbClass = Private::usbClassOf(device, desc);
    }
    return info;
}

std::string LibusbEventSource::getDeviceIdentifier(libusb_device* device) {
    uint8_t busNum = libusb_get_bus_number(device);
    uint8_t devAddr = libusb_get_device_address(device);

    libusb_device_descriptor desc;
    if (libusb_get_device_descriptor(device, &desc) != 0) {
        desc.idVendor = 0;
        desc.idProduct = 0;
    }

    std::stringstream ss;
    ss << std::hex << std::uppercase
       << std::setw(4) << std::setfill('0') << desc.idVendor << ":"
       << std::setw(4) << std::setfill('0') << desc.idProduct << ":"
       << std::setw(2) << std::setfill('0') << static_cast<int>(busNum) << ":"
       << std::setw(2) << std::setfill('0') << static_cast<int>(devAddr);

    return ss.str();
}

std::unique_ptr<UsbEventSource> createPlatformUsbEventSource() {
    if (auto source = LibusbEventSource::create()) {
        return source;
    }
    LOG_WARNING("USB device monitoring disabled: libusb is not available on this host");
    return std::make_unique<NullUsbEventSource>();
}

}
