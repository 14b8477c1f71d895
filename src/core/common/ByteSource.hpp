#pragma once

#include <QtCore/QByteArray>
#include <memory>

#include "Expected.hpp"
#include "StreamError.hpp"

namespace Swarmcast {

/**
 * @brief Blocking, cancellable byte stream
 *
 * read() may suspend while pieces or transcoder output arrive, so it is only
 * called from ioThreadPool() workers. cancel() may be called from any thread
 * and makes a pending or later read() return Cancelled promptly.
 */
class ByteSource {
public:
    virtual ~ByteSource() = default;

    /**
     * @brief Reads up to @p maxBytes
     * @return Data, an empty array at end of stream, or the failure
     */
    virtual Expected<QByteArray, StreamError> read(qint64 maxBytes) = 0;

    virtual void cancel() = 0;
};

/**
 * @brief Source with an already-read head chunk in front of it
 *
 * Used after the first-byte wait so the bytes that proved readiness are not lost.
 */
class PrefetchedSource : public ByteSource {
public:
    PrefetchedSource(QByteArray head, std::shared_ptr<ByteSource> rest)
        : head_(std::move(head)), rest_(std::move(rest)) {}

    Expected<QByteArray, StreamError> read(qint64 maxBytes) override {
        if (!head_.isEmpty()) {
            QByteArray chunk = head_.left(maxBytes);
            head_.remove(0, chunk.size());
            return chunk;
        }
        return rest_->read(maxBytes);
    }

    void cancel() override { rest_->cancel(); }

private:
    QByteArray head_;
    std::shared_ptr<ByteSource> rest_;
};

} // namespace Swarmcast
