#pragma once
#include <QJsonObject>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace sampler_monitor {

struct StreamMessage {
    enum class Kind {
        Event,
        Keepalive,
        Closed
    };

    Kind kind{Kind::Closed};
    std::string payload;   // serialized JSON for Kind::Event
};

// One live stream client. The queue is unbounded; once closed, pushes fail
// and receive() drains what is left before reporting Closed.
class Subscriber {
public:
    Subscriber();
    ~Subscriber();

    Subscriber(const Subscriber&) = delete;
    Subscriber& operator=(const Subscriber&) = delete;

    bool push(std::string payload);
    StreamMessage receive(std::chrono::milliseconds timeout);
    void close();
    bool isOpen() const;
    size_t pending() const;

private:
    class Private;
    std::unique_ptr<Private> d;
};

class EventBroadcaster {
public:
    using SnapshotProvider = std::function<std::vector<std::string>()>;

    EventBroadcaster();
    ~EventBroadcaster();

    EventBroadcaster(const EventBroadcaster&) = delete;
    EventBroadcaster& operator=(const EventBroadcaster&) = delete;

    // The snapshot is queued before the subscriber becomes visible to
    // publish(), both under the subscriber lock, so no event published
    // after the snapshot was taken can be missed or overtake it.
    std::shared_ptr<Subscriber> subscribe(const SnapshotProvider& snapshot = {});
    void unsubscribe(const std::shared_ptr<Subscriber>& subscriber);

    // Serializes once and queues to every open subscriber. Closed
    // subscribers are dropped. Returns the number of deliveries.
    size_t publish(const std::string& eventType, const QJsonObject& payload);

    size_t subscriberCount() const;

    static std::string serializeEvent(const std::string& eventType, const QJsonObject& payload);

private:
    class Private;
    std::unique_ptr<Private> d;
};

}
