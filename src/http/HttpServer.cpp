#include "HttpServer.hpp"
#include "../core/DeviceCatalog.hpp"
#include "../core/DeviceMonitor.hpp"
#include "../core/EventBroadcaster.hpp"
#include "../core/Logger.hpp"
#include "../core/StatusEvents.hpp"
#include "../core/StatusRegistry.hpp"
#include "../utils/ConfigManager.hpp"
#include <httplib.h>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QProcess>
#include <QStringList>
#include <QtGlobal>
#include <algorithm>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <system_error>
#include <thread>
#include <vector>

namespace sampler_monitor {

namespace {

constexpr const char* JSON_CONTENT_TYPE = "application/json";

std::string toJson(const QJsonObject& object) {
    return QJsonDocument(object).toJson(QJsonDocument::Compact).toStdString();
}

HttpResponse errorResponse(int status, const std::string& message) {
    QJsonObject body;
    body.insert(QStringLiteral("error"), QString::fromStdString(message));
    return {status, toJson(body)};
}

void send(httplib::Response& res, const HttpResponse& response) {
    res.status = response.status;
    res.set_content(response.body, JSON_CONTENT_TYPE);
}

// One thread per connection, so event streams that stay open for hours
// never hold up other requests. Finished threads are joined on the next
// enqueue and the rest on shutdown.
class ConnectionThreads : public httplib::TaskQueue {
public:
    bool enqueue(std::function<void()> fn) override {
        std::lock_guard<std::mutex> lock(threadsMutex);
        if (closed) {
            return false;
        }
        joinFinished();

        auto finished = std::make_shared<std::atomic<bool>>(false);
        try {
            std::thread thread([fn = std::move(fn), finished] {
                try {
                    fn();
                } catch (const std::exception& e) {
                    LOG_ERROR("HTTP connection failed: " + std::string(e.what()));
                }
                *finished = true;
            });
            workers.push_back(Worker{std::move(thread), finished});
        } catch (const std::system_error& e) {
            LOG_ERROR("Could not start HTTP connection thread: " + std::string(e.what()));
            return false;
        }
        return true;
    }

    void shutdown() override {
        std::vector<Worker> remaining;
        {
            std::lock_guard<std::mutex> lock(threadsMutex);
            closed = true;
            remaining.swap(workers);
        }
        for (auto& worker : remaining) {
            if (worker.thread.joinable()) {
                worker.thread.join();
            }
        }
    }

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> finished;
    };

    void joinFinished() {
        auto it = workers.begin();
        while (it != workers.end()) {
            if (*it->finished) {
                it->thread.join();
                it = workers.erase(it);
            } else {
                ++it;
            }
        }
    }

    std::mutex threadsMutex;
    std::vector<Worker> workers;
    bool closed{false};
};

} // namespace

class HttpServer::Private {
public:
    DeviceMonitor& monitor;
    HttpServerSettings settings;
    DirectoryOpener opener;

    httplib::Server server;
    std::thread listener;
    std::atomic<bool> running{false};
    int boundPort{-1};

    // Open event streams, closed on stop() so their connection threads return
    std::vector<std::shared_ptr<Subscriber>> streams;
    bool stopping{false};
    std::mutex streamsMutex;

    Private(DeviceMonitor& monitor, HttpServerSettings settings, DirectoryOpener opener)
        : monitor(monitor)
        , settings(settings)
        , opener(std::move(opener)) {
    }

    void trackStream(const std::shared_ptr<Subscriber>& subscriber) {
        std::lock_guard<std::mutex> lock(streamsMutex);
        if (stopping) {
            // Ends the stream after the snapshot
            subscriber->close();
            return;
        }
        streams.push_back(subscriber);
    }

    void releaseStream(const std::shared_ptr<Subscriber>& subscriber) {
        {
            std::lock_guard<std::mutex> lock(streamsMutex);
            streams.erase(std::remove(streams.begin(), streams.end(), subscriber), streams.end());
        }
        monitor.closeEventStream(subscriber);
    }
};

HttpServer::HttpServer(DeviceMonitor& monitor,
                       HttpServerSettings settings,
                       DirectoryOpener opener)
    : d(std::make_unique<Private>(monitor, settings, std::move(opener))) {
    registerRoutes();
}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::registerRoutes() {
    d->server.new_task_queue = [] { return new ConnectionThreads(); };

    d->server.Get("/device-status", [this](const httplib::Request&, httplib::Response& res) {
        send(res, deviceStatus());
    });

    d->server.Get("/device-events", [this](const httplib::Request&, httplib::Response& res) {
        d->monitor.initialize();

        auto subscriber = d->monitor.openEventStream();
        d->trackStream(subscriber);

        res.set_header("Cache-Control", "no-cache");
        res.set_header("X-Accel-Buffering", "no");
        res.set_chunked_content_provider(
            "text/event-stream",
            [this, subscriber](size_t, httplib::DataSink& sink) {
                StreamMessage message = subscriber->receive(d->settings.keepaliveInterval);
                if (message.kind == StreamMessage::Kind::Closed) {
                    sink.done();
                    return true;
                }
                std::string frame = formatEventFrame(message);
                // A failed write means the client is gone
                return sink.write(frame.data(), frame.size());
            },
            [this, subscriber](bool) {
                d->releaseStream(subscriber);
            });
    });

    d->server.Get("/open-device-directory", [this](const httplib::Request& req, httplib::Response& res) {
        std::string device = req.has_param("device") ? req.get_param_value("device") : "opz";
        send(res, openDeviceDirectory(device));
    });

    d->server.Get("/refresh-device-scan", [this](const httplib::Request&, httplib::Response& res) {
        send(res, refreshDeviceScan());
    });

    d->server.set_exception_handler(
        [](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
            std::string what;
            try {
                std::rethrow_exception(ep);
            } catch (const std::exception& e) {
                what = e.what();
            } catch (...) {
                what = "unknown error";
            }
            LOG_ERROR("Request " + req.path + " failed: " + what);
            send(res, errorResponse(500, "Internal server error"));
        });
}

bool HttpServer::start(const std::string& host, int port) {
    if (d->running) {
        return true;
    }

    if (port == 0) {
        d->boundPort = d->server.bind_to_any_port(host);
    } else if (d->server.bind_to_port(host, port)) {
        d->boundPort = port;
    } else {
        d->boundPort = -1;
    }

    if (d->boundPort <= 0) {
        LOG_ERROR("Failed to bind HTTP server to " + host + ":" + std::to_string(port));
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(d->streamsMutex);
        d->stopping = false;
    }
    d->running = true;
    d->listener = std::thread([this] {
        if (!d->server.listen_after_bind()) {
            LOG_ERROR("HTTP server stopped unexpectedly");
        }
        d->running = false;
    });

    LOG_INFO("HTTP server listening on " + host + ":" + std::to_string(d->boundPort));
    return true;
}

void HttpServer::stop() {
    {
        std::lock_guard<std::mutex> lock(d->streamsMutex);
        d->stopping = true;
        for (auto& stream : d->streams) {
            stream->close();
        }
    }

    d->server.stop();
    if (d->listener.joinable()) {
        d->listener.join();
    }
    d->running = false;
}

bool HttpServer::isRunning() const {
    return d->running;
}

int HttpServer::port() const {
    return d->boundPort;
}

HttpResponse HttpServer::deviceStatus() {
    d->monitor.initialize();
    return {200, toJson(statusMapToJson(d->monitor.catalog(), d->monitor.registry()))};
}

HttpResponse HttpServer::refreshDeviceScan() {
    d->monitor.scanConnectedDevices();
    return {200, toJson(statusMapToJson(d->monitor.catalog(), d->monitor.registry()))};
}

std::optional<std::string> HttpServer::resolveDevicePath(const std::string& device) const {
    const DeviceKind* kind = d->monitor.catalog().find(device);
    if (!kind) {
        return std::nullopt;
    }

    DeviceStatus status = d->monitor.registry().read(device);
    if (status.path && !status.path->empty()) {
        return status.path;
    }

    std::string configured = d->monitor.config().effectiveMountPath(*kind);
    if (!configured.empty()) {
        return configured;
    }
    return std::nullopt;
}

HttpResponse HttpServer::openDeviceDirectory(const std::string& device) {
    auto path = resolveDevicePath(device);
    if (!path || !QFileInfo::exists(QString::fromStdString(*path))) {
        return errorResponse(404, "Device path not found");
    }

    std::string error;
    if (!d->opener(*path, error)) {
        LOG_ERROR("Failed to open " + *path + ": " + error);
        return errorResponse(500, error);
    }

    QJsonObject body;
    body.insert(QStringLiteral("success"), true);
    return {200, toJson(body)};
}

std::string HttpServer::formatEventFrame(const StreamMessage& message) {
    switch (message.kind) {
        case StreamMessage::Kind::Event:
            return "data: " + message.payload + "\n\n";
        case StreamMessage::Kind::Keepalive:
            return ": keepalive\n\n";
        case StreamMessage::Kind::Closed:
        default:
            return {};
    }
}

bool HttpServer::openInFileBrowser(const std::string& path, std::string& error) {
#if defined(Q_OS_MACOS)
    const QString program = QStringLiteral("open");
#elif defined(Q_OS_WIN)
    const QString program = QStringLiteral("explorer");
#else
    const QString program = QStringLiteral("xdg-open");
#endif

    if (!QProcess::startDetached(program, QStringList() << QString::fromStdString(path))) {
        error = "Failed to launch " + program.toStdString();
        return false;
    }
    return true;
}

}
