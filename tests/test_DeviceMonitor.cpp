#include <gtest/gtest.h>
#include "DeviceMonitor.hpp"
#include "EventBroadcaster.hpp"
#include "Logger.hpp"
#include "StatusRegistry.hpp"
#include "ConfigManager.hpp"
#include "TestSupport.hpp"
#include <QCoreApplication>
#include <QJsonDocument>
#include <QJsonObject>
#include <algorithm>
#include <stdexcept>
#include <thread>

namespace sampler_monitor {
namespace testing {

using namespace std::chrono_literals;

class DeviceMonitorTest : public ::testing::Test {
protected:
    void SetUp() override {
        app = std::make_unique<QCoreApplication>(argc, argv);
    }

    void TearDown() override {
        monitor.reset();
        app.reset();
    }

    void createMonitor(std::chrono::milliseconds pollInterval = 5ms, int pollAttempts = 30) {
        MonitorSettings settings;
        settings.poll.maxAttempts = pollAttempts;
        settings.poll.interval = pollInterval;
        settings.mountSettleDelay = 0ms;

        auto usb = std::make_unique<FakeUsbEventSource>();
        source = usb.get();
        monitor = std::make_unique<DeviceMonitor>(DeviceCatalog::instance(), registry, broadcaster,
                                                  config, locator, std::move(usb), settings);
    }

    // Events queued so far, without blocking
    static std::vector<QJsonObject> drain(const std::shared_ptr<Subscriber>& subscriber) {
        std::vector<QJsonObject> events;
        for (;;) {
            StreamMessage message = subscriber->receive(0ms);
            if (message.kind != StreamMessage::Kind::Event) {
                break;
            }
            events.push_back(QJsonDocument::fromJson(QByteArray::fromStdString(message.payload)).object());
        }
        return events;
    }

    static bool recentLogsContain(const std::string& text) {
        auto logs = Logger::instance().getRecentLogs(50);
        return std::any_of(logs.begin(), logs.end(),
            [&text](const std::string& line) { return line.find(text) != std::string::npos; });
    }

    static MountResult mounted(const std::string& path, DeviceMode mode = DeviceMode::Storage) {
        return MountResult{path, mode};
    }

    static int argc;
    static char* argv[];

    std::unique_ptr<QCoreApplication> app;
    ScriptedMountLocator locator;
    ConfigManager config;
    StatusRegistry registry{DeviceCatalog::instance()};
    EventBroadcaster broadcaster;
    FakeUsbEventSource* source{nullptr};
    std::unique_ptr<DeviceMonitor> monitor;
};

int DeviceMonitorTest::argc = 1;
char* DeviceMonitorTest::argv[] = {const_cast<char*>("sampler_monitor_tests"), nullptr};

TEST_F(DeviceMonitorTest, StandbyThenStorageOnceMounted) {
    locator.setScript("opz", [](int call) {
        return call >= 4 ? mounted("/Volumes/OP-Z") : MountResult{};
    });
    createMonitor();

    auto stream = monitor->openEventStream();
    ASSERT_EQ(drain(stream).size(), 2u);

    monitor->handleConnect(usbDevice(std::string("2367"), std::string("000c"), "USBSTOR"));
    monitor->waitForPolls();

    auto events = drain(stream);
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].value("type").toString(), "device_status");
    EXPECT_EQ(events[0].value("device").toString(), "opz");
    EXPECT_EQ(events[0].value("mode").toString(), "standby");
    EXPECT_TRUE(events[0].value("connected").toBool());
    EXPECT_TRUE(events[0].value("path").isNull());
    EXPECT_EQ(events[1].value("mode").toString(), "storage");
    EXPECT_EQ(events[1].value("path").toString(), "/Volumes/OP-Z");

    DeviceStatus status = registry.read("opz");
    EXPECT_TRUE(status.connected);
    EXPECT_TRUE(status.usbDetected);
    EXPECT_EQ(status.path, std::string("/Volumes/OP-Z"));
    EXPECT_EQ(status.mode, DeviceMode::Storage);
    EXPECT_EQ(locator.calls("opz"), 4);
}

TEST_F(DeviceMonitorTest, ImmediateMountSkipsPolling) {
    locator.setScript("op1", [](int) { return mounted("/Volumes/OP-1"); });
    createMonitor();

    monitor->handleConnect(usbDevice(TE_VENDOR_ID, 0x0002));

    EXPECT_FALSE(monitor->isPolling("op1"));
    EXPECT_EQ(registry.read("op1").path, std::string("/Volumes/OP-1"));
    EXPECT_EQ(locator.calls("op1"), 1);
}

TEST_F(DeviceMonitorTest, Op1StorageSearchesWithoutMode) {
    locator.setScript("op1", [](int call) {
        return call >= 3 ? mounted("/Volumes/OP-1") : MountResult{};
    });
    createMonitor();
    auto stream = monitor->openEventStream();
    drain(stream);

    monitor->handleConnect(usbDevice(std::string("0x2367"), std::string("0x0002")));
    monitor->waitForPolls();

    auto events = drain(stream);
    ASSERT_EQ(events.size(), 2u);
    EXPECT_TRUE(events[0].value("connected").toBool());
    EXPECT_TRUE(events[0].value("mode").isNull());
    EXPECT_EQ(events[1].value("mode").toString(), "storage");
}

TEST_F(DeviceMonitorTest, UpgradeVolumeIsReported) {
    locator.setScript("opz", [](int) { return mounted("/Volumes/OPZ", DeviceMode::Upgrade); });
    createMonitor();

    monitor->handleConnect(usbDevice(9063, 12));

    EXPECT_EQ(registry.read("opz").mode, DeviceMode::Upgrade);
    EXPECT_EQ(config.getString(ConfigKeys::OPZ_DETECTED_PATH), "");
}

TEST_F(DeviceMonitorTest, MidiModeIsOther) {
    createMonitor();

    monitor->handleConnect(usbDevice(std::string("2367"), std::string("000c"), "MEDIA"));
    monitor->handleConnect(usbDevice(std::string("2367"), std::string("0004")));

    for (const char* kind : {"opz", "op1"}) {
        DeviceStatus status = registry.read(kind);
        EXPECT_TRUE(status.connected) << kind;
        EXPECT_EQ(status.mode, DeviceMode::Other) << kind;
        EXPECT_FALSE(status.path.has_value()) << kind;
        EXPECT_FALSE(monitor->isPolling(kind)) << kind;
    }
    EXPECT_EQ(locator.calls("opz"), 0);
}

TEST_F(DeviceMonitorTest, DisconnectCancelsPolling) {
    createMonitor(10s);

    monitor->handleConnect(usbDevice(TE_VENDOR_ID, 0x000c, "USBSTOR"));
    EXPECT_TRUE(monitor->isPolling("opz"));

    auto before = std::chrono::steady_clock::now();
    monitor->handleDisconnect(usbDevice(TE_VENDOR_ID, 0x000c));
    EXPECT_LT(std::chrono::steady_clock::now() - before, 2s);

    EXPECT_FALSE(monitor->isPolling("opz"));
    DeviceStatus status = registry.read("opz");
    EXPECT_FALSE(status.connected);
    EXPECT_FALSE(status.usbDetected);
    EXPECT_EQ(status.mode, DeviceMode::None);

    int calls = locator.calls("opz");
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(locator.calls("opz"), calls);
}

TEST_F(DeviceMonitorTest, SecondConnectKeepsSinglePoll) {
    createMonitor(10s);

    monitor->handleConnect(usbDevice(TE_VENDOR_ID, 0x0002));
    monitor->handleConnect(usbDevice(TE_VENDOR_ID, 0x0002));
    std::this_thread::sleep_for(100ms);

    // Two immediate lookups plus the first attempt of one poll
    EXPECT_EQ(locator.calls("op1"), 3);
    EXPECT_TRUE(monitor->isPolling("op1"));
    monitor->stopMonitoring();
}

TEST_F(DeviceMonitorTest, UnknownProductIsIgnoredAndLogged) {
    createMonitor();
    auto stream = monitor->openEventStream();
    drain(stream);

    monitor->handleConnect(usbDevice(TE_VENDOR_ID, 0x0099));
    monitor->handleConnect(usbDevice(0x046d, 0x000c));
    monitor->handleConnect(usbDevice(std::string("vendor?"), std::string("000c")));
    monitor->handleDisconnect(usbDevice(TE_VENDOR_ID, 0x0099));

    EXPECT_TRUE(drain(stream).empty());
    EXPECT_FALSE(registry.read("opz").connected);
    EXPECT_FALSE(registry.read("op1").connected);
    EXPECT_TRUE(recentLogsContain("Unknown product id 153"));
}

TEST_F(DeviceMonitorTest, ThrowingLookupIsAbsorbed) {
    locator.setScript("op1", [](int) -> MountResult { throw std::runtime_error("stat failed"); });
    createMonitor();

    EXPECT_NO_THROW(monitor->handleConnect(usbDevice(TE_VENDOR_ID, 0x0002)));
    EXPECT_TRUE(recentLogsContain("stat failed"));

    // Nothing stays locked after the failure
    EXPECT_TRUE(monitor->applyStatus("op1", DeviceStatus{true, std::nullopt, true, DeviceMode::Other}));
    EXPECT_EQ(registry.read("op1").mode, DeviceMode::Other);
}

TEST_F(DeviceMonitorTest, DetectedPathMirroredToConfig) {
    locator.setScript("opz", [](int) { return mounted("/Volumes/OP-Z"); });
    createMonitor();

    monitor->handleConnect(usbDevice(TE_VENDOR_ID, 0x000c));
    EXPECT_EQ(config.getString(ConfigKeys::OPZ_DETECTED_PATH), "/Volumes/OP-Z");

    monitor->handleDisconnect(usbDevice(TE_VENDOR_ID, 0x000c));
    EXPECT_TRUE(config.contains(ConfigKeys::OPZ_DETECTED_PATH));
    EXPECT_EQ(config.getString(ConfigKeys::OPZ_DETECTED_PATH), "");
}

TEST_F(DeviceMonitorTest, DeveloperModeLeavesConfigAlone) {
    config.setBool(ConfigKeys::DEVELOPER_MODE, true);
    config.setString(ConfigKeys::OPZ_DETECTED_PATH, "/manual/opz");
    locator.setScript("opz", [](int) { return mounted("/Volumes/OP-Z"); });
    createMonitor();

    monitor->handleConnect(usbDevice(TE_VENDOR_ID, 0x000c));
    EXPECT_EQ(registry.read("opz").path, std::string("/Volumes/OP-Z"));
    EXPECT_EQ(config.getString(ConfigKeys::OPZ_DETECTED_PATH), "/manual/opz");

    monitor->handleDisconnect(usbDevice(TE_VENDOR_ID, 0x000c));
    EXPECT_EQ(config.getString(ConfigKeys::OPZ_DETECTED_PATH), "/manual/opz");
}

TEST_F(DeviceMonitorTest, RepeatedStatusIsNotBroadcast) {
    createMonitor();
    auto stream = monitor->openEventStream();
    drain(stream);
    int signalled = 0;
    QObject::connect(monitor.get(), &DeviceMonitor::deviceStatusChanged,
        [&signalled](const std::string&) { ++signalled; });

    DeviceStatus other{true, std::nullopt, true, DeviceMode::Other};
    EXPECT_TRUE(monitor->applyStatus("op1", other));
    EXPECT_FALSE(monitor->applyStatus("op1", other));
    EXPECT_FALSE(monitor->applyStatus("op2", other));

    EXPECT_EQ(drain(stream).size(), 1u);
    EXPECT_EQ(signalled, 1);
}

TEST_F(DeviceMonitorTest, StartupScanSeedsStatus) {
    locator.setScript("op1", [](int) { return mounted("/Volumes/OP-1"); });
    createMonitor();
    source->present = {
        usbDevice(std::string("2367"), std::string("000c"), "MEDIA"),
        usbDevice(std::string("2367"), std::string("0002"), "USBSTOR"),
        usbDevice(std::string("05ac"), std::string("12a8"))
    };

    monitor->initialize();

    EXPECT_EQ(registry.read("op1").mode, DeviceMode::Storage);
    EXPECT_EQ(registry.read("op1").path, std::string("/Volumes/OP-1"));
    EXPECT_EQ(registry.read("opz").mode, DeviceMode::Other);
    EXPECT_TRUE(monitor->isMonitoring());
}

TEST_F(DeviceMonitorTest, StartupScanFindsStandbyDevice) {
    createMonitor();
    source->present = {usbDevice(std::string("2367"), std::string("000c"), "USBSTOR")};

    monitor->scanConnectedDevices();

    DeviceStatus status = registry.read("opz");
    EXPECT_TRUE(status.connected);
    EXPECT_EQ(status.mode, DeviceMode::Standby);
    EXPECT_FALSE(monitor->isPolling("opz"));
}

TEST_F(DeviceMonitorTest, InitializeRunsOnce) {
    createMonitor();

    monitor->initialize();
    monitor->initialize();

    EXPECT_TRUE(monitor->isInitialized());
    EXPECT_EQ(source->startCount, 1);
    EXPECT_EQ(locator.calls("opz"), 1);
}

TEST_F(DeviceMonitorTest, HotplugEventsReachMonitor) {
    locator.setScript("op1", [](int call) {
        return call >= 2 ? mounted("/Volumes/OP-1") : MountResult{};
    });
    createMonitor();
    monitor->initialize();

    ASSERT_TRUE(source->onConnect);
    EXPECT_FALSE(registry.read("op1").connected);
    source->onConnect(usbDevice(TE_VENDOR_ID, 0x0002));
    EXPECT_EQ(registry.read("op1").path, std::string("/Volumes/OP-1"));

    source->onDisconnect(usbDevice(TE_VENDOR_ID, 0x0002));
    EXPECT_FALSE(registry.read("op1").connected);
}

TEST_F(DeviceMonitorTest, MissingHotplugSupportStillScans) {
    locator.setScript("opz", [](int) { return mounted("/Volumes/OP-Z"); });
    DeviceMonitor plain(DeviceCatalog::instance(), registry, broadcaster, config, locator, nullptr);

    plain.initialize();

    EXPECT_FALSE(plain.isMonitoring());
    EXPECT_EQ(registry.read("opz").mode, DeviceMode::Storage);
    EXPECT_TRUE(recentLogsContain("hot-plug monitoring unavailable"));
}

TEST_F(DeviceMonitorTest, StopMonitoringCancelsPolls) {
    createMonitor(10s);
    monitor->initialize();
    monitor->handleConnect(usbDevice(TE_VENDOR_ID, 0x0002));
    ASSERT_TRUE(monitor->isPolling("op1"));

    auto before = std::chrono::steady_clock::now();
    monitor->stopMonitoring();
    EXPECT_LT(std::chrono::steady_clock::now() - before, 2s);

    EXPECT_FALSE(monitor->isPolling("op1"));
    EXPECT_FALSE(monitor->isMonitoring());
    EXPECT_EQ(source->stopCount, 1);
}

} // namespace testing
} // namespace sampler_monitor
