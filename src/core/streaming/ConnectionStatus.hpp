#pragma once

#include <QtCore/QHash>
#include <QtCore/QJsonObject>
#include <QtCore/QMutex>
#include <QtCore/QObject>
#include <QtCore/QQueue>
#include <QtCore/QTimer>
#include <QtCore/QWaitCondition>
#include <memory>
#include <optional>

#include "../common/Config.hpp"
#include "../media/CodecClassifier.hpp"
#include "../torrent/SwarmClient.hpp"

namespace Swarmcast {

/// Ordered; a channel never moves to a lower stage
enum class ConnectionStage {
    Initializing = 0,
    Connecting,
    SearchingPeers,
    DownloadingMetadata,
    Buffering,
    Ready,
    Error
};

QString stageName(ConnectionStage stage);
bool isTerminalStage(ConnectionStage stage);

struct ConnectionStatus {
    ConnectionStage stage = ConnectionStage::Initializing;
    QString message;
    int numPeers = 0;
    double progress = 0.0;
    double fileProgress = -1.0;   // negative when the file size is not known yet
    qint64 downloadSpeed = 0;
    qint64 uploadSpeed = 0;
    qint64 downloaded = 0;
    qint64 uploaded = 0;
    bool fileReady = false;
    int fileIndex = -1;
    qint64 timestamp = 0;         // ms since epoch

    bool ready() const { return stage == ConnectionStage::Ready; }
    bool sameFigures(const ConnectionStatus& other) const;
    QJsonObject toJson() const;
};

class StatusChannel;

/**
 * @brief One subscriber's view of a StatusChannel
 *
 * Starts with the channel's state at subscription time and ends after a
 * terminal stage or when the channel closes.
 */
class StatusReader {
public:
    enum class Result {
        Event,
        Timeout,
        Ended
    };

    struct Read {
        Result result = Result::Ended;
        ConnectionStatus status;
    };

    explicit StatusReader(std::shared_ptr<StatusChannel> channel);

    /// Waits up to @p timeoutMs for the next status
    Read next(int timeoutMs);

private:
    friend class StatusChannel;

    std::shared_ptr<StatusChannel> channel_;
    QQueue<ConnectionStatus> queue_;   // guarded by the channel's mutex
    bool terminalSeen_ = false;
};

/**
 * @brief Per-watcher status sequence, single writer and many readers
 *
 * publish() drops transitions to an earlier stage; Error is accepted from any
 * non-terminal stage. Nothing is accepted after Ready or Error.
 */
class StatusChannel : public std::enable_shared_from_this<StatusChannel> {
public:
    explicit StatusChannel(const QString& watcherId);

    /// @return false if the status was dropped
    bool publish(const ConnectionStatus& status);

    std::shared_ptr<StatusReader> subscribe();
    void close();

    std::optional<ConnectionStatus> current() const;
    QString watcherId() const { return watcherId_; }
    bool isClosed() const;

private:
    friend class StatusReader;

    QString watcherId_;
    mutable QMutex mutex_;
    QWaitCondition changed_;
    std::optional<ConnectionStatus> current_;
    QList<std::weak_ptr<StatusReader>> readers_;
    bool closed_ = false;
};

/**
 * @brief Derives watcher status from swarm statistics and feeds the channels
 *
 * Polls the SwarmClient on a timer; each tracked watcher gets a new status
 * when its stage or its figures change.
 */
class ConnectionStatusPublisher : public QObject {
    Q_OBJECT

public:
    ConnectionStatusPublisher(SwarmClient* swarmClient, const Config::StreamingSettings& settings,
                              QObject* parent = nullptr);
    ~ConnectionStatusPublisher() override;

    /// Starts publishing for a watcher; publishes the initial status immediately
    void track(const QString& watcherId, const SwarmHandle& swarm, int fileIndex);

    /// Records file size and kind once known, enabling fileReady
    void setFileInfo(const QString& watcherId, qint64 fileLength, MediaKind kind);

    void publishError(const QString& watcherId, StreamError error);

    /// Closes the watcher's channel; readers end after draining
    void untrack(const QString& watcherId);

    /// Fresh reader for a tracked watcher, nullptr if unknown
    std::shared_ptr<StatusReader> subscribe(const QString& watcherId);

    /// Current status of a tracked watcher, if any
    std::optional<ConnectionStatus> current(const QString& watcherId) const;

    static ConnectionStatus derive(const std::optional<SwarmStats>& stats, const DhtStatus& dht,
                                   int fileIndex, qint64 fileLength, MediaKind kind,
                                   const Config::StreamingSettings& settings);

    static bool isFileReady(qint64 bytesDone, qint64 fileLength, MediaKind kind,
                            const Config::StreamingSettings& settings);

public slots:
    void poll();

private:
    struct Tracked {
        SwarmHandle swarm;
        int fileIndex = -1;
        qint64 fileLength = -1;
        MediaKind kind = MediaKind::Video;
        std::shared_ptr<StatusChannel> channel;
    };

    void publishFor(const Tracked& tracked);

    SwarmClient* swarmClient_;
    Config::StreamingSettings settings_;
    QTimer* pollTimer_;

    mutable QMutex mutex_;
    QHash<QString, Tracked> tracked_;
};

} // namespace Swarmcast
