#include "PollTask.hpp"
#include "Logger.hpp"
#include <atomic>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <thread>

namespace sampler_monitor {

class PollTask::Private {
public:
    std::string kind;
    PollSettings settings;
    Condition stillSearching;
    Attempt attempt;

    std::thread worker;
    std::mutex joinMutex;
    std::mutex stateMutex;
    std::condition_variable wakeup;
    bool cancelled{false};
    std::atomic<bool> running{false};
    std::atomic<PollOutcome> outcome{PollOutcome::Running};
    std::atomic<int> attempts{0};

    bool sleepInterval() {
        std::unique_lock<std::mutex> lock(stateMutex);
        return !wakeup.wait_for(lock, settings.interval, [this] { return cancelled; });
    }

    bool isCancelled() {
        std::lock_guard<std::mutex> lock(stateMutex);
        return cancelled;
    }

    PollOutcome run() {
        for (int i = 0; i < settings.maxAttempts; ++i) {
            if (isCancelled()) {
                return PollOutcome::Cancelled;
            }
            if (stillSearching && !stillSearching()) {
                return PollOutcome::Abandoned;
            }

            attempts = i + 1;
            if (attempt(i + 1)) {
                LOG_INFO("Found mount path for " + kind + " on attempt " + std::to_string(i + 1));
                return PollOutcome::Found;
            }

            if (!sleepInterval()) {
                return PollOutcome::Cancelled;
            }
        }

        LOG_WARNING("Mount path polling timed out for " + kind + " after " +
                    std::to_string(settings.maxAttempts) + " attempts");
        return PollOutcome::Exhausted;
    }
};

PollTask::PollTask(std::string kind,
                   PollSettings settings,
                   Condition stillSearching,
                   Attempt attempt)
    : d(std::make_shared<Private>()) {
    d->kind = std::move(kind);
    d->settings = settings;
    d->stillSearching = std::move(stillSearching);
    d->attempt = std::move(attempt);
}

PollTask::~PollTask() {
    cancel();
    if (d->worker.joinable() && d->worker.get_id() == std::this_thread::get_id()) {
        d->worker.detach();
        return;
    }
    wait();
}

void PollTask::start() {
    if (d->worker.joinable()) {
        return;
    }

    d->running = true;
    d->worker = std::thread([state = d] {
        PollOutcome result = PollOutcome::Exhausted;
        try {
            result = state->run();
        } catch (const std::exception& e) {
            LOG_ERROR("Mount polling for " + state->kind + " failed: " + std::string(e.what()));
        }
        state->outcome = result;
        state->running = false;
    });
}

void PollTask::cancel() {
    {
        std::lock_guard<std::mutex> lock(d->stateMutex);
        d->cancelled = true;
    }
    d->wakeup.notify_all();
}

void PollTask::wait() {
    std::lock_guard<std::mutex> lock(d->joinMutex);
    if (d->worker.joinable() && d->worker.get_id() != std::this_thread::get_id()) {
        d->worker.join();
    }
}

bool PollTask::isRunning() const {
    return d->running;
}

PollOutcome PollTask::outcome() const {
    return d->outcome;
}

int PollTask::attempts() const {
    return d->attempts;
}

const std::string& PollTask::kind() const {
    return d->kind;
}

}
