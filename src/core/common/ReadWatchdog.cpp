#include "ReadWatchdog.hpp"
#include "IoThreadPool.hpp"
#include "Logger.hpp"

#include <QtConcurrent/QtConcurrent>
#include <QtCore/QDeadlineTimer>
#include <QtCore/QMutex>
#include <QtCore/QWaitCondition>

namespace Swarmcast {

struct ReadWatchdog::State {
    mutable QMutex mutex;
    QWaitCondition wake;
    bool done = false;
    bool fired = false;
};

ReadWatchdog::ReadWatchdog(std::shared_ptr<ByteSource> source, int timeoutMs)
    : state_(std::make_shared<State>()) {
    auto state = state_;
    future_ = QtConcurrent::run(ioThreadPool(), [state, source, timeoutMs]() {
        QMutexLocker locker(&state->mutex);
        QDeadlineTimer deadline(timeoutMs);
        while (!state->done) {
            if (!state->wake.wait(&state->mutex, deadline)) {
                SWARMCAST_DEBUG("Read deadline of {} ms reached, cancelling source", timeoutMs);
                state->fired = true;
                locker.unlock();
                source->cancel();
                return;
            }
        }
    });
}

ReadWatchdog::~ReadWatchdog() {
    {
        QMutexLocker locker(&state_->mutex);
        state_->done = true;
        state_->wake.wakeAll();
    }
    future_.waitForFinished();
}

bool ReadWatchdog::fired() const {
    QMutexLocker locker(&state_->mutex);
    return state_->fired;
}

} // namespace Swarmcast
