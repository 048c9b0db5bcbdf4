#include "DeviceCatalog.hpp"
#include <sampler-monitor/Constants.hpp>
#include <algorithm>

namespace sampler_monitor {

namespace {

std::vector<DeviceKind> builtinKinds() {
    DeviceKind opz;
    opz.id = "opz";
    opz.name = "OP-Z";
    opz.displayNameLong = "Teenage Engineering OP-Z";
    opz.storageKb = 24000;
    opz.vendorId = TE_VENDOR_ID;
    opz.productModes = {{0x000c, ProductRole::SharedMode}};
    opz.requiredDirectories = {"samplepacks"};
    opz.categoryDirectories = {
        "1-kick", "2-snare", "3-perc", "4-fx",
        "5-bass", "6-lead", "7-arpeggio", "8-chord"
    };
    opz.upgradeModeMarkers = {"how_to_upgrade.txt", "systeminfo"};
    opz.manualPathKey = ConfigKeys::OPZ_MOUNT_PATH;
    opz.detectedPathKey = ConfigKeys::OPZ_DETECTED_PATH;

    DeviceKind op1;
    op1.id = "op1";
    op1.name = "OP-1";
    op1.displayNameLong = "Teenage Engineering OP-1";
    op1.storageKb = 512000;
    op1.vendorId = TE_VENDOR_ID;
    op1.productModes = {
        {0x0002, ProductRole::MassStorage},
        {0x0004, ProductRole::Midi}
    };
    op1.requiredDirectories = {"drum", "synth"};
    op1.manualPathKey = ConfigKeys::OP1_MOUNT_PATH;
    op1.detectedPathKey = ConfigKeys::OP1_DETECTED_PATH;

    return {opz, op1};
}

} // namespace

std::vector<int> DeviceKind::productIds() const {
    std::vector<int> ids;
    ids.reserve(productModes.size());
    for (const auto& mode : productModes) {
        ids.push_back(mode.productId);
    }
    return ids;
}

bool DeviceKind::hasProductId(int productId) const {
    return std::any_of(productModes.begin(), productModes.end(),
        [productId](const ProductMode& mode) { return mode.productId == productId; });
}

class DeviceCatalog::Private {
public:
    std::vector<DeviceKind> kinds;
};

const DeviceCatalog& DeviceCatalog::instance() {
    static const DeviceCatalog catalog(builtinKinds());
    return catalog;
}

DeviceCatalog::DeviceCatalog(std::vector<DeviceKind> kinds)
    : d(std::make_unique<Private>()) {
    d->kinds = std::move(kinds);
}

DeviceCatalog::~DeviceCatalog() = default;

const std::vector<DeviceKind>& DeviceCatalog::all() const {
    return d->kinds;
}

const DeviceKind* DeviceCatalog::find(const std::string& id) const {
    for (const auto& kind : d->kinds) {
        if (kind.id == id) {
            return &kind;
        }
    }
    return nullptr;
}

const DeviceKind* DeviceCatalog::findByIds(int vendorId, int productId) const {
    for (const auto& kind : d->kinds) {
        if (kind.vendorId == vendorId && kind.hasProductId(productId)) {
            return &kind;
        }
    }
    return nullptr;
}

std::optional<ClassifiedDevice> DeviceCatalog::classify(int vendorId,
                                                        int productId,
                                                        const std::string& usbClass) const {
    for (const auto& kind : d->kinds) {
        if (kind.vendorId != vendorId) {
            continue;
        }
        for (const auto& mode : kind.productModes) {
            if (mode.productId != productId) {
                continue;
            }

            ClassifiedDevice result;
            result.kind = &kind;
            switch (mode.role) {
                case ProductRole::MassStorage:
                    result.role = ConnectionRole::Storage;
                    break;
                case ProductRole::Midi:
                    result.role = ConnectionRole::Other;
                    break;
                case ProductRole::SharedMode:
                    // Powered on it enumerates as MEDIA; anything else is
                    // either its disk or the device sitting switched off
                    result.role = usbClass == UsbClass::MEDIA
                        ? ConnectionRole::Other
                        : ConnectionRole::PendingStorage;
                    break;
            }
            return result;
        }
    }
    return std::nullopt;
}

}
