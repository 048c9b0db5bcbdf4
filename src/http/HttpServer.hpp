#pragma once
#include <sampler-monitor/Constants.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace sampler_monitor {

class DeviceMonitor;
struct StreamMessage;

struct HttpResponse {
    int status{200};
    std::string body;
};

struct HttpServerSettings {
    // Idle time before a ": keepalive" frame is sent on an event stream
    std::chrono::milliseconds keepaliveInterval{KEEPALIVE_INTERVAL};
};

// JSON and event-stream endpoints over the device monitor. Every connection
// is served on its own thread:
//   GET /device-status
//   GET /device-events
//   GET /open-device-directory?device=<kind>
//   GET /refresh-device-scan
class HttpServer {
public:
    // Opens a directory in the host file browser; fills error on failure.
    using DirectoryOpener = std::function<bool(const std::string& path, std::string& error)>;

    explicit HttpServer(DeviceMonitor& monitor,
                        HttpServerSettings settings = HttpServerSettings{},
                        DirectoryOpener opener = &HttpServer::openInFileBrowser);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Binds and serves on a background thread. Port 0 picks a free port.
    bool start(const std::string& host, int port);
    void stop();
    bool isRunning() const;
    int port() const;

    HttpResponse deviceStatus();
    HttpResponse openDeviceDirectory(const std::string& device);
    HttpResponse refreshDeviceScan();

    // Registry path if known, otherwise the configured one.
    std::optional<std::string> resolveDevicePath(const std::string& device) const;

    // "data: <json>\n\n" for events, ": keepalive\n\n" for keepalives.
    static std::string formatEventFrame(const StreamMessage& message);
    static bool openInFileBrowser(const std::string& path, std::string& error);

private:
    void registerRoutes();

    class Private;
    std::unique_ptr<Private> d;
};

}
