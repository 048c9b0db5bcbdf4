#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace sampler_monitor {

struct PollSettings {
    int maxAttempts{30};
    std::chrono::milliseconds interval{1000};
};

enum class PollOutcome {
    Running,
    Found,
    Abandoned,   // device gone or path resolved elsewhere
    Cancelled,
    Exhausted
};

// Retries a mount lookup on its own thread until it succeeds, the device
// stops waiting for a path, the attempts run out, or cancel() is called.
// cancel() wakes the task mid-interval.
class PollTask {
public:
    using Condition = std::function<bool()>;
    using Attempt = std::function<bool(int attempt)>;

    PollTask(std::string kind,
             PollSettings settings,
             Condition stillSearching,
             Attempt attempt);
    ~PollTask();

    PollTask(const PollTask&) = delete;
    PollTask& operator=(const PollTask&) = delete;

    void start();
    void cancel();
    // Blocks until the task thread has finished.
    void wait();

    bool isRunning() const;
    PollOutcome outcome() const;
    int attempts() const;
    const std::string& kind() const;

private:
    class Private;
    // Shared with the worker thread, which may outlive this object
    std::shared_ptr<Private> d;
};

}
