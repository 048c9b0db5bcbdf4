#pragma once

namespace sampler_monitor {

constexpr int TE_VENDOR_ID = 0x2367;

constexpr int POLL_MAX_ATTEMPTS = 30;
constexpr int POLL_INTERVAL = 1000;        // ms
constexpr int MOUNT_SETTLE_DELAY = 1500;   // ms
constexpr int KEEPALIVE_INTERVAL = 30000;  // ms
constexpr int USB_POLLING_INTERVAL = 1000; // ms, used when libusb has no hotplug
constexpr int USB_EVENT_TIMEOUT = 250;     // ms

constexpr int DEFAULT_HTTP_PORT = 5000;

namespace UsbClass {
    constexpr const char* STORAGE = "USBSTOR";
    constexpr const char* MEDIA = "MEDIA";
}

namespace ConfigKeys {
    constexpr const char* DEVELOPER_MODE = "DEVELOPER_MODE";
    constexpr const char* OPZ_MOUNT_PATH = "OPZ_MOUNT_PATH";
    constexpr const char* OP1_MOUNT_PATH = "OP1_MOUNT_PATH";
    constexpr const char* OPZ_DETECTED_PATH = "OPZ_DETECTED_PATH";
    constexpr const char* OP1_DETECTED_PATH = "OP1_DETECTED_PATH";
}

namespace EventTypes {
    constexpr const char* DEVICE_STATUS = "device_status";
}

}
