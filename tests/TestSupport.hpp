#pragma once
#include "DeviceCatalog.hpp"
#include "MountResolver.hpp"
#include "UsbEventSource.hpp"
#include <QDir>
#include <QFile>
#include <QString>
#include <QStringList>
#include <atomic>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace sampler_monitor {
namespace testing {

// Answers findMount from a per-kind script and counts the calls.
class ScriptedMountLocator : public MountLocator {
public:
    using Script = std::function<MountResult(int call)>;

    void setScript(const std::string& kind, Script script) {
        std::lock_guard<std::mutex> lock(scriptMutex);
        scripts[kind] = std::move(script);
    }

    MountResult findMount(const DeviceKind& kind) const override {
        Script script;
        int call = 0;
        {
            std::lock_guard<std::mutex> lock(scriptMutex);
            call = ++callCounts[kind.id];
            auto it = scripts.find(kind.id);
            if (it == scripts.end()) {
                return {};
            }
            script = it->second;
        }
        return script(call);
    }

    int calls(const std::string& kind) const {
        std::lock_guard<std::mutex> lock(scriptMutex);
        auto it = callCounts.find(kind);
        return it != callCounts.end() ? it->second : 0;
    }

private:
    mutable std::mutex scriptMutex;
    std::map<std::string, Script> scripts;
    mutable std::map<std::string, int> callCounts;
};

class FakeUsbEventSource : public UsbEventSource {
public:
    std::vector<UsbDeviceInfo> present;
    Callback onConnect;
    Callback onDisconnect;
    std::atomic<int> startCount{0};
    std::atomic<int> stopCount{0};

    std::vector<UsbDeviceInfo> enumerate() override { return present; }

    bool startMonitoring(Callback connect, Callback disconnect) override {
        onConnect = std::move(connect);
        onDisconnect = std::move(disconnect);
        ++startCount;
        return true;
    }

    void stopMonitoring() override { ++stopCount; }
    bool isAvailable() const override { return true; }
};

inline UsbDeviceInfo usbDevice(UsbIdValue vendor, UsbIdValue product, std::string usbClass = "") {
    UsbDeviceInfo info;
    info.deviceId = "test-device";
    info.vendorId = std::move(vendor);
    info.productId = std::move(product);
    info.usbClass = std::move(usbClass);
    return info;
}

inline void makeDirs(const QString& root, const QStringList& relative) {
    for (const auto& dir : relative) {
        QDir(root).mkpath(dir);
    }
}

inline void touch(const QString& root, const QString& relative) {
    QFile file(QDir(root).filePath(relative));
    file.open(QIODevice::WriteOnly);
    file.write("x");
}

inline const DeviceKind& opz() {
    return *DeviceCatalog::instance().find("opz");
}

inline const DeviceKind& op1() {
    return *DeviceCatalog::instance().find("op1");
}

} // namespace testing
} // namespace sampler_monitor
