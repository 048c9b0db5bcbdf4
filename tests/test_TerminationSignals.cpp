#include <gtest/gtest.h>
#include "TerminationSignals.hpp"
#include <QCoreApplication>
#include <QTimer>
#include <csignal>

namespace sampler_monitor {
namespace testing {

class TerminationSignalsTest : public ::testing::Test {
protected:
    void SetUp() override {
        app = std::make_unique<QCoreApplication>(argc, argv);
    }

    void TearDown() override {
        app.reset();
    }

    static int argc;
    static char* argv[];
    std::unique_ptr<QCoreApplication> app;
};

int TerminationSignalsTest::argc = 1;
char* TerminationSignalsTest::argv[] = {const_cast<char*>("sampler_monitor_tests"), nullptr};

TEST_F(TerminationSignalsTest, SignalArrivesOnEventLoop) {
    TerminationSignals termination;
    ASSERT_TRUE(termination.install({SIGUSR1}));

    int received = 0;
    QObject::connect(&termination, &TerminationSignals::terminationRequested, app.get(),
        [this, &received](int signalNumber) {
            received = signalNumber;
            app->quit();
        });

    QTimer::singleShot(0, [] { std::raise(SIGUSR1); });
    QTimer::singleShot(5000, app.get(), [this] { app->exit(1); });

    EXPECT_EQ(app->exec(), 0);
    EXPECT_EQ(received, SIGUSR1);
}

TEST_F(TerminationSignalsTest, OneInstanceAtATime) {
    {
        TerminationSignals first;
        ASSERT_TRUE(first.install({SIGUSR2}));

        TerminationSignals second;
        EXPECT_FALSE(second.install({SIGUSR2}));
    }

    TerminationSignals again;
    EXPECT_TRUE(again.install({SIGUSR2}));
}

} // namespace testing
} // namespace sampler_monitor
