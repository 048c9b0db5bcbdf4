#pragma once
#include <QObject>
#include <memory>
#include <vector>

namespace sampler_monitor {

// Delivers process signals such as SIGINT and SIGTERM as a Qt signal on the
// event loop. The handler itself only writes the signal number to a socket
// pair; a QSocketNotifier reads it back on the thread owning this object.
// One instance may be installed at a time, and the previous handlers are
// restored on destruction.
class TerminationSignals : public QObject {
    Q_OBJECT

public:
    explicit TerminationSignals(QObject* parent = nullptr);
    ~TerminationSignals() override;

    bool install(const std::vector<int>& signalNumbers);

signals:
    void terminationRequested(int signalNumber);

private:
    class Private;
    std::unique_ptr<Private> d;
};

}
