#pragma once
#include <sampler-monitor/Types.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sampler_monitor {

// How a product id of a device kind presents itself on the bus.
enum class ProductRole {
    MassStorage,    // exposes a disk only
    Midi,           // audio/MIDI only, never a disk
    SharedMode      // one id for MIDI and disk mode, told apart by USB class
};

struct ProductMode {
    int productId;
    ProductRole role;
};

struct DeviceKind {
    std::string id;
    std::string name;
    std::string displayNameLong;
    int storageKb{0};
    int vendorId{0};
    std::vector<ProductMode> productModes;
    std::vector<std::string> requiredDirectories;
    // Sub-folders of the first required directory; at least one must exist
    std::vector<std::string> categoryDirectories;
    std::vector<std::string> upgradeModeMarkers;
    std::string manualPathKey;
    std::string detectedPathKey;

    std::vector<int> productIds() const;
    bool hasProductId(int productId) const;
};

struct ClassifiedDevice {
    const DeviceKind* kind{nullptr};
    ConnectionRole role{ConnectionRole::Other};
};

class DeviceCatalog {
public:
    static const DeviceCatalog& instance();

    explicit DeviceCatalog(std::vector<DeviceKind> kinds);
    ~DeviceCatalog();

    DeviceCatalog(const DeviceCatalog&) = delete;
    DeviceCatalog& operator=(const DeviceCatalog&) = delete;

    const std::vector<DeviceKind>& all() const;
    const DeviceKind* find(const std::string& id) const;

    // Matches normalized ids against the catalog. The USB class only matters
    // for SharedMode products.
    std::optional<ClassifiedDevice> classify(int vendorId,
                                             int productId,
                                             const std::string& usbClass) const;
    // Kind owning the ids, whatever its mode; used for disconnects.
    const DeviceKind* findByIds(int vendorId, int productId) const;

private:
    class Private;
    std::unique_ptr<Private> d;
};

}
