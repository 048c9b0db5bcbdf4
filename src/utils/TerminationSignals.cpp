#include "TerminationSignals.hpp"
#include "../core/Logger.hpp"
#include <QSocketNotifier>
#include <QtGlobal>
#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <map>
#include <string>

#ifdef Q_OS_UNIX
#include <sys/socket.h>
#include <unistd.h>
#endif

namespace sampler_monitor {

namespace {

std::atomic<bool> handlersInstalled{false};

#ifdef Q_OS_UNIX
// Write end of the socket pair, -1 while nothing is installed
volatile sig_atomic_t signalWriteFd = -1;

// Runs in signal context: write(2) only
void forwardSignal(int signalNumber) {
    const int savedErrno = errno;
    const int fd = signalWriteFd;
    if (fd >= 0) {
        const unsigned char byte = static_cast<unsigned char>(signalNumber);
        if (::write(fd, &byte, 1) < 0) {
            // Nothing can be reported from here
        }
    }
    errno = savedErrno;
}
#endif

} // namespace

class TerminationSignals::Private {
public:
    int sockets[2]{-1, -1};
    std::unique_ptr<QSocketNotifier> notifier;
    bool installed{false};
#ifdef Q_OS_UNIX
    std::map<int, struct sigaction> previousActions;
#endif
};

TerminationSignals::TerminationSignals(QObject* parent)
    : QObject(parent)
    , d(std::make_unique<Private>()) {
}

TerminationSignals::~TerminationSignals() {
#ifdef Q_OS_UNIX
    if (!d->installed) {
        return;
    }
    for (const auto& [signalNumber, action] : d->previousActions) {
        ::sigaction(signalNumber, &action, nullptr);
    }
    signalWriteFd = -1;
    d->notifier.reset();
    ::close(d->sockets[0]);
    ::close(d->sockets[1]);
    handlersInstalled = false;
#endif
}

bool TerminationSignals::install(const std::vector<int>& signalNumbers) {
#ifdef Q_OS_UNIX
    if (d->installed) {
        return true;
    }

    bool expected = false;
    if (!handlersInstalled.compare_exchange_strong(expected, true)) {
        LOG_WARNING("Termination signal handlers are already installed");
        return false;
    }

    if (::socketpair(AF_UNIX, SOCK_STREAM, 0, d->sockets) != 0) {
        LOG_ERROR("Failed to create signal socket pair: " + std::string(std::strerror(errno)));
        handlersInstalled = false;
        return false;
    }

    d->notifier = std::make_unique<QSocketNotifier>(d->sockets[1], QSocketNotifier::Read);
    connect(d->notifier.get(), &QSocketNotifier::activated, this, [this] {
        unsigned char byte = 0;
        if (::read(d->sockets[1], &byte, 1) == 1) {
            LOG_INFO("Received signal " + std::to_string(byte));
            emit terminationRequested(static_cast<int>(byte));
        }
    });
    signalWriteFd = d->sockets[0];
    d->installed = true;

    bool ok = true;
    for (int signalNumber : signalNumbers) {
        struct sigaction action;
        std::memset(&action, 0, sizeof(action));
        action.sa_handler = forwardSignal;
        sigemptyset(&action.sa_mask);
        action.sa_flags = SA_RESTART;

        struct sigaction previous;
        if (::sigaction(signalNumber, &action, &previous) != 0) {
            LOG_ERROR("Failed to install handler for signal " + std::to_string(signalNumber) +
                      ": " + std::string(std::strerror(errno)));
            ok = false;
            continue;
        }
        d->previousActions[signalNumber] = previous;
    }
    return ok;
#else
    Q_UNUSED(signalNumbers);
    LOG_WARNING("Termination signal handling is not available on this platform");
    return false;
#endif
}

}
