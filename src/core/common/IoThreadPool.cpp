#include "IoThreadPool.hpp"
#include "Logger.hpp"

#include <QtCore/QCoreApplication>
#include <QtCore/QElapsedTimer>

namespace Swarmcast {

QThreadPool* ioThreadPool() {
    static QThreadPool* pool = [] {
        auto* p = new QThreadPool();
        p->setMaxThreadCount(256);
        p->setExpiryTimeout(30000);
        return p;
    }();
    return pool;
}

void drainIoThreadPool(int reportIntervalMs) {
    QElapsedTimer timer;
    timer.start();
    qint64 nextReport = reportIntervalMs;
    while (!ioThreadPool()->waitForDone(50)) {
        QCoreApplication::processEvents(QEventLoop::AllEvents, 50);
        if (timer.elapsed() >= nextReport) {
            SWARMCAST_WARN("Still waiting for {} I/O workers after {} ms",
                           ioThreadPool()->activeThreadCount(), timer.elapsed());
            nextReport += reportIntervalMs;
        }
    }
}

} // namespace Swarmcast
