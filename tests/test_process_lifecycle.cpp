#include <QtTest/QtTest>
#include <QtConcurrent/QtConcurrent>
#include "../src/core/common/IoThreadPool.hpp"
#include "../src/core/common/TerminationSignals.hpp"
#include "utils/TestUtils.hpp"

#include <atomic>
#include <csignal>

using namespace Swarmcast;
using namespace Swarmcast::Test;

class TestProcessLifecycle : public QObject {
    Q_OBJECT

private slots:
    void testSignalArrivesThroughEventLoop() {
        TerminationSignals terminationSignals;
        QSignalSpy spy(&terminationSignals, &TerminationSignals::received);
        QVERIFY(terminationSignals.install({SIGUSR1}));

        QCOMPARE(::raise(SIGUSR1), 0);
        // Nothing is emitted from inside the handler
        QCOMPARE(spy.count(), 0);

        QVERIFY(spy.wait(2000));
        QCOMPARE(spy.count(), 1);
        QCOMPARE(spy.first().at(0).toInt(), static_cast<int>(SIGUSR1));
    }

    void testSecondInstanceIsRefused() {
        TerminationSignals first;
        QVERIFY(first.install({SIGUSR2}));
        TerminationSignals second;
        QVERIFY(!second.install({SIGUSR2}));
    }

    void testDrainWaitsForSlowWorkers() {
        std::atomic<bool> finished{false};
        auto future = QtConcurrent::run(ioThreadPool(), [&finished]() {
            QThread::msleep(1500);
            finished = true;
        });
        Q_UNUSED(future);

        drainIoThreadPool(200);
        QVERIFY(finished.load());
        QCOMPARE(ioThreadPool()->activeThreadCount(), 0);
    }

    void testDrainServesQueuedCallsFromWorkers() {
        QObject receiver;
        std::atomic<bool> delivered{false};
        std::atomic<bool> finished{false};
        auto future = QtConcurrent::run(ioThreadPool(), [&]() {
            QThread::msleep(100);
            QMetaObject::invokeMethod(&receiver, [&delivered]() { delivered = true; },
                                      Qt::BlockingQueuedConnection);
            finished = true;
        });
        Q_UNUSED(future);

        drainIoThreadPool(200);
        QVERIFY(delivered.load());
        QVERIFY(finished.load());
    }
};

int runTestProcessLifecycle(int argc, char** argv) {
    TestProcessLifecycle test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_process_lifecycle.moc"
