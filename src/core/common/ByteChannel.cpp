#include "ByteChannel.hpp"

#include <QtCore/QDeadlineTimer>

namespace Swarmcast {

ByteChannel::ByteChannel(qint64 capacityBytes, int stallTimeoutMs)
    : capacityBytes_(capacityBytes)
    , stallTimeoutMs_(stallTimeoutMs) {
}

bool ByteChannel::push(const QByteArray& chunk) {
    QMutexLocker locker(&mutex_);
    if (finished_ || cancelled_ || error_) {
        return false;
    }
    // An empty chunk would read as end of stream
    if (chunk.isEmpty()) {
        return true;
    }
    if (queuedBytes_ + chunk.size() > capacityBytes_) {
        error_ = StreamError::BufferOverflow;
        chunks_.clear();
        queuedBytes_ = 0;
        dataAvailable_.wakeAll();
        return false;
    }
    chunks_.enqueue(chunk);
    queuedBytes_ += chunk.size();
    dataAvailable_.wakeAll();
    return true;
}

void ByteChannel::finish() {
    QMutexLocker locker(&mutex_);
    finished_ = true;
    dataAvailable_.wakeAll();
}

void ByteChannel::fail(StreamError error) {
    QMutexLocker locker(&mutex_);
    if (!error_) {
        error_ = error;
    }
    dataAvailable_.wakeAll();
}

Expected<QByteArray, StreamError> ByteChannel::read(qint64 maxBytes) {
    QMutexLocker locker(&mutex_);
    QDeadlineTimer deadline(stallTimeoutMs_);

    while (chunks_.isEmpty() && !finished_ && !cancelled_ && !error_) {
        if (!dataAvailable_.wait(&mutex_, deadline)) {
            return makeUnexpected(StreamError::SwarmTimeout);
        }
    }

    if (cancelled_) {
        return makeUnexpected(StreamError::Cancelled);
    }
    // A failure discards whatever is still queued
    if (error_) {
        return makeUnexpected(*error_);
    }
    if (chunks_.isEmpty()) {
        return QByteArray();
    }

    QByteArray& front = chunks_.head();
    if (front.size() <= maxBytes) {
        QByteArray chunk = chunks_.dequeue();
        queuedBytes_ -= chunk.size();
        return chunk;
    }

    QByteArray chunk = front.left(maxBytes);
    front.remove(0, chunk.size());
    queuedBytes_ -= chunk.size();
    return chunk;
}

void ByteChannel::cancel() {
    QMutexLocker locker(&mutex_);
    cancelled_ = true;
    chunks_.clear();
    queuedBytes_ = 0;
    dataAvailable_.wakeAll();
}

qint64 ByteChannel::queuedBytes() const {
    QMutexLocker locker(&mutex_);
    return queuedBytes_;
}

bool ByteChannel::isClosed() const {
    QMutexLocker locker(&mutex_);
    return finished_ || cancelled_ || error_.has_value();
}

} // namespace Swarmcast
