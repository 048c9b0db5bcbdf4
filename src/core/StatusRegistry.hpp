#pragma once
#include <sampler-monitor/Types.hpp>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sampler_monitor {

class DeviceCatalog;

// Current status of every catalog kind. Reads hand out copies; update()
// only replaces a value that actually differs.
class StatusRegistry {
public:
    explicit StatusRegistry(const DeviceCatalog& catalog);
    ~StatusRegistry();

    StatusRegistry(const StatusRegistry&) = delete;
    StatusRegistry& operator=(const StatusRegistry&) = delete;

    // Returns true when the stored status changed. Unknown kinds are
    // rejected. A path is only kept for storage/upgrade modes.
    bool update(const std::string& kind,
                bool connected,
                std::optional<std::string> path,
                bool usbDetected,
                DeviceMode mode);
    bool update(const std::string& kind, const DeviceStatus& status);

    DeviceStatus read(const std::string& kind) const;
    std::map<std::string, DeviceStatus> readAll() const;
    bool contains(const std::string& kind) const;
    std::vector<std::string> kinds() const;

private:
    class Private;
    std::unique_ptr<Private> d;
};

}
