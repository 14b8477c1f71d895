#pragma once

#include <QtCore/QObject>
#include <QtCore/QString>
#include <memory>

#include "../common/Config.hpp"
#include "SwarmClient.hpp"

namespace Swarmcast {

/**
 * @brief SwarmClient over a single libtorrent session
 *
 * Owns the lt::session and one entry per joined info hash. Alerts are pumped
 * on this object's thread by a timer; worker threads blocked in
 * waitForMetadata() or on a piece read are woken from there.
 *
 * Joined torrents download nothing until a reader calls setPriority(), so a
 * metadata-only join costs the DHT lookup and the metadata exchange only.
 */
class LibTorrentSwarmClient : public QObject, public SwarmClient {
    Q_OBJECT

public:
    explicit LibTorrentSwarmClient(QObject* parent = nullptr);
    ~LibTorrentSwarmClient() override;

    // Non-copyable, non-movable
    LibTorrentSwarmClient(const LibTorrentSwarmClient&) = delete;
    LibTorrentSwarmClient& operator=(const LibTorrentSwarmClient&) = delete;

    /**
     * @brief Creates the session
     * @param settings Listen interfaces, DHT and rate settings
     * @return true on success, SwarmUnavailable if the session could not start
     */
    Expected<bool, StreamError> initialize(const Config::SwarmSettings& settings);
    void shutdown();
    bool isInitialized() const;

    // SwarmClient
    Expected<SwarmHandle, StreamError> join(const MagnetUri& magnet) override;
    void leave(const SwarmHandle& handle) override;
    Expected<TorrentMetadata, StreamError> waitForMetadata(
        const SwarmHandle& handle, std::chrono::milliseconds timeout) override;
    Expected<std::shared_ptr<ByteSource>, StreamError> readRange(
        const SwarmHandle& handle, int fileIndex, qint64 byteStart, qint64 byteEnd) override;
    void setPriority(const SwarmHandle& handle, int fileIndex,
                     qint64 byteStart, qint64 byteEnd) override;
    std::optional<SwarmStats> stats(const QString& infoHash) const override;
    QList<SwarmStats> allStats() const override;
    DhtStatus dhtStatus() const override;
    int activeSwarmCount() const override;

    static QString libtorrentVersion();

signals:
    void swarmJoined(const QString& infoHash);
    void metadataReceived(const QString& infoHash);
    void swarmRemoved(const QString& infoHash);
    void dhtStateChanged(bool ready, int nodeCount);

private slots:
    void processAlerts();
    void postStatistics();

private:
    struct LibTorrentSwarmClientPrivate;
    std::unique_ptr<LibTorrentSwarmClientPrivate> d;
};

} // namespace Swarmcast
