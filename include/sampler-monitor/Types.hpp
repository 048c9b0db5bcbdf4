#pragma once
#include <optional>
#include <string>
#include <variant>

namespace sampler_monitor {

// Vendor/product ids as a platform reports them: missing, numeric, or text
// ("0x2367", "2367", "9063").
using UsbIdValue = std::variant<std::monostate, int, std::string>;

struct UsbDeviceInfo {
    std::string deviceId;
    UsbIdValue vendorId;
    UsbIdValue productId;
    std::string usbClass;   // "MEDIA", "USBSTOR" or empty
};

enum class DeviceMode {
    None,
    Storage,
    Upgrade,
    Other,
    Standby
};

// Transient connection role derived from the product id and USB class.
enum class ConnectionRole {
    Other,
    Storage,
    PendingStorage
};

struct DeviceStatus {
    bool connected{false};
    std::optional<std::string> path;
    bool usbDetected{false};
    DeviceMode mode{DeviceMode::None};

    bool operator==(const DeviceStatus& other) const {
        return connected == other.connected &&
               path == other.path &&
               usbDetected == other.usbDetected &&
               mode == other.mode;
    }

    bool operator!=(const DeviceStatus& other) const {
        return !(*this == other);
    }
};

struct MountResult {
    std::optional<std::string> path;
    DeviceMode mode{DeviceMode::None};

    bool found() const { return path.has_value(); }
};

inline bool isMountedMode(DeviceMode mode) {
    return mode == DeviceMode::Storage || mode == DeviceMode::Upgrade;
}

// Wire name of a mode; None has no name and is rendered as JSON null.
inline std::optional<std::string> modeName(DeviceMode mode) {
    switch (mode) {
        case DeviceMode::Storage: return std::string("storage");
        case DeviceMode::Upgrade: return std::string("upgrade");
        case DeviceMode::Other:   return std::string("other");
        case DeviceMode::Standby: return std::string("standby");
        case DeviceMode::None:
        default:                  return std::nullopt;
    }
}

}
