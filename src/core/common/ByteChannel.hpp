#pragma once

#include <QtCore/QByteArray>
#include <QtCore/QMutex>
#include <QtCore/QQueue>
#include <QtCore/QWaitCondition>
#include <optional>

#include "ByteSource.hpp"

namespace Swarmcast {

/**
 * @brief Bounded single-producer byte queue read as a ByteSource
 *
 * The producer pushes chunks and finally calls finish() or fail(). A push
 * that would exceed the capacity fails the channel with BufferOverflow.
 */
class ByteChannel : public ByteSource {
public:
    /**
     * @param capacityBytes Queue limit before the reader is considered lost
     * @param stallTimeoutMs Longest read() wait without data, then SwarmTimeout
     */
    explicit ByteChannel(qint64 capacityBytes, int stallTimeoutMs = 120000);

    /// @return false if the channel is closed or just overflowed
    bool push(const QByteArray& chunk);
    void finish();
    void fail(StreamError error);

    Expected<QByteArray, StreamError> read(qint64 maxBytes) override;
    void cancel() override;

    qint64 queuedBytes() const;
    bool isClosed() const;

private:
    mutable QMutex mutex_;
    QWaitCondition dataAvailable_;
    QQueue<QByteArray> chunks_;
    qint64 queuedBytes_ = 0;
    qint64 capacityBytes_;
    int stallTimeoutMs_;
    bool finished_ = false;
    bool cancelled_ = false;
    std::optional<StreamError> error_;
};

} // namespace Swarmcast
