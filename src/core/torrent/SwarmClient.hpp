#pragma once

#include <QtCore/QList>
#include <chrono>
#include <memory>
#include <optional>

#include "../common/ByteSource.hpp"
#include "../common/Expected.hpp"
#include "../common/StreamError.hpp"
#include "MagnetUri.hpp"
#include "SwarmTypes.hpp"

namespace Swarmcast {

/**
 * @brief Peer-wire/DHT transport as seen by the streaming engine
 *
 * Implementations are thread-safe; blocking calls (waitForMetadata and
 * reads on the returned sources) are made from worker threads only.
 */
class SwarmClient {
public:
    virtual ~SwarmClient() = default;

    /**
     * @brief Joins the swarm for @p magnet or adds a lease to the existing join
     *
     * At most one swarm exists per info hash; concurrent joins share it.
     */
    virtual Expected<SwarmHandle, StreamError> join(const MagnetUri& magnet) = 0;

    /// Releases one lease; the swarm is removed with its last lease. Idempotent.
    virtual void leave(const SwarmHandle& handle) = 0;

    /**
     * @brief Blocks until metadata is known
     * @return Metadata, SwarmTimeout after @p timeout, Cancelled if the swarm was left
     */
    virtual Expected<TorrentMetadata, StreamError> waitForMetadata(
        const SwarmHandle& handle, std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Sequential reader over [byteStart, byteEnd] of one file (inclusive)
     */
    virtual Expected<std::shared_ptr<ByteSource>, StreamError> readRange(
        const SwarmHandle& handle, int fileIndex, qint64 byteStart, qint64 byteEnd) = 0;

    /// Biases piece selection toward [byteStart, byteEnd] of one file
    virtual void setPriority(const SwarmHandle& handle, int fileIndex,
                             qint64 byteStart, qint64 byteEnd) = 0;

    virtual std::optional<SwarmStats> stats(const QString& infoHash) const = 0;
    virtual QList<SwarmStats> allStats() const = 0;
    virtual DhtStatus dhtStatus() const = 0;
    virtual int activeSwarmCount() const = 0;
};

} // namespace Swarmcast
