#include "EventBroadcaster.hpp"
#include "Logger.hpp"
#include <QJsonDocument>
#include <QString>
#include <algorithm>
#include <condition_variable>
#include <deque>
#include <mutex>

namespace sampler_monitor {

class Subscriber::Private {
public:
    std::deque<std::string> queue;
    bool open{true};
    mutable std::mutex queueMutex;
    std::condition_variable queueCondition;
};

Subscriber::Subscriber()
    : d(std::make_unique<Private>()) {
}

Subscriber::~Subscriber() = default;

bool Subscriber::push(std::string payload) {
    {
        std::lock_guard<std::mutex> lock(d->queueMutex);
        if (!d->open) {
            return false;
        }
        d->queue.push_back(std::move(payload));
    }
    d->queueCondition.notify_one();
    return true;
}

StreamMessage Subscriber::receive(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(d->queueMutex);
    bool ready = d->queueCondition.wait_for(lock, timeout, [this] {
        return !d->queue.empty() || !d->open;
    });

    StreamMessage message;
    if (!d->queue.empty()) {
        message.kind = StreamMessage::Kind::Event;
        message.payload = std::move(d->queue.front());
        d->queue.pop_front();
    } else if (!ready) {
        message.kind = StreamMessage::Kind::Keepalive;
    } else {
        message.kind = StreamMessage::Kind::Closed;
    }
    return message;
}

void Subscriber::close() {
    {
        std::lock_guard<std::mutex> lock(d->queueMutex);
        d->open = false;
    }
    d->queueCondition.notify_all();
}

bool Subscriber::isOpen() const {
    std::lock_guard<std::mutex> lock(d->queueMutex);
    return d->open;
}

size_t Subscriber::pending() const {
    std::lock_guard<std::mutex> lock(d->queueMutex);
    return d->queue.size();
}

class EventBroadcaster::Private {
public:
    std::vector<std::shared_ptr<Subscriber>> subscribers;
    mutable std::mutex subscribersMutex;
};

EventBroadcaster::EventBroadcaster()
    : d(std::make_unique<Private>()) {
}

EventBroadcaster::~EventBroadcaster() {
    std::lock_guard<std::mutex> lock(d->subscribersMutex);
    for (auto& subscriber : d->subscribers) {
        subscriber->close();
    }
    d->subscribers.clear();
}

std::shared_ptr<Subscriber> EventBroadcaster::subscribe(const SnapshotProvider& snapshot) {
    auto subscriber = std::make_shared<Subscriber>();

    std::lock_guard<std::mutex> lock(d->subscribersMutex);
    if (snapshot) {
        for (auto& payload : snapshot()) {
            subscriber->push(std::move(payload));
        }
    }
    d->subscribers.push_back(subscriber);
    LOG_DEBUG("Stream subscriber added, " + std::to_string(d->subscribers.size()) + " active");
    return subscriber;
}

void EventBroadcaster::unsubscribe(const std::shared_ptr<Subscriber>& subscriber) {
    if (!subscriber) {
        return;
    }
    subscriber->close();

    std::lock_guard<std::mutex> lock(d->subscribersMutex);
    auto it = std::find(d->subscribers.begin(), d->subscribers.end(), subscriber);
    if (it != d->subscribers.end()) {
        d->subscribers.erase(it);
        LOG_DEBUG("Stream subscriber removed, " + std::to_string(d->subscribers.size()) + " active");
    }
}

size_t EventBroadcaster::publish(const std::string& eventType, const QJsonObject& payload) {
    const std::string message = serializeEvent(eventType, payload);

    size_t delivered = 0;
    std::lock_guard<std::mutex> lock(d->subscribersMutex);
    auto it = d->subscribers.begin();
    while (it != d->subscribers.end()) {
        if ((*it)->push(message)) {
            ++delivered;
            ++it;
        } else {
            it = d->subscribers.erase(it);
        }
    }
    return delivered;
}

size_t EventBroadcaster::subscriberCount() const {
    std::lock_guard<std::mutex> lock(d->subscribersMutex);
    return d->subscribers.size();
}

std::string EventBroadcaster::serializeEvent(const std::string& eventType, const QJsonObject& payload) {
    QJsonObject event = payload;
    event.insert(QStringLiteral("type"), QString::fromStdString(eventType));
    return QJsonDocument(event).toJson(QJsonDocument::Compact).toStdString();
}

}
