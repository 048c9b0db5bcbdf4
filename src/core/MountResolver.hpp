#pragma once
#include <sampler-monitor/Types.hpp>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace sampler_monitor {

struct DeviceKind;

class MountLocator {
public:
    virtual ~MountLocator() = default;
    virtual MountResult findMount(const DeviceKind& kind) const = 0;
};

using RootEnumerator = std::function<std::vector<std::string>()>;

class MountResolver : public MountLocator {
public:
    // Scans the host's removable volume roots.
    MountResolver();
    // Scans whatever roots the enumerator returns, in order.
    explicit MountResolver(RootEnumerator enumerator);
    ~MountResolver() override;

    MountResolver(const MountResolver&) = delete;
    MountResolver& operator=(const MountResolver&) = delete;

    MountResult findMount(const DeviceKind& kind) const override;

    // Volume roots for the current platform: /Volumes/* on macOS, existing
    // drive letters on Windows, /media/<user>/* and /run/media/<user>/* on
    // Linux. Empty elsewhere.
    static std::vector<std::string> platformRoots();

    static bool hasUpgradeMarker(const DeviceKind& kind, const std::string& root);
    // Empty when the layout is valid, otherwise why it was rejected.
    static std::string validateStructure(const DeviceKind& kind, const std::string& root);

private:
    class Private;
    std::unique_ptr<Private> d;
};

}
