#pragma once

#include <QtCore/QByteArray>
#include <QtCore/QElapsedTimer>
#include <QtCore/QFuture>
#include <QtCore/QHash>
#include <QtCore/QMutex>
#include <QtCore/QObject>
#include <QtCore/QProcess>
#include <QtCore/QString>
#include <QtCore/QTimer>
#include <atomic>
#include <functional>
#include <memory>
#include <optional>

#include "../common/ByteChannel.hpp"
#include "../common/Config.hpp"
#include "Mp4FragmentParser.hpp"
#include "TranscodePlan.hpp"

namespace Swarmcast {

struct TranscodeCommand {
    QString program;
    QStringList arguments;
};

using TranscodeCommandFactory = std::function<TranscodeCommand(const TranscodePlan&)>;

struct TranscodeSessionInfo {
    QString id;
    qint64 pid = 0;
    QString infoHash;
    int fileIndex = -1;
    qint64 runtimeMs = 0;
    int subscribers = 0;
    TranscodeMode mode = TranscodeMode::Full;
    QString inputVideoCodec;
    QString inputAudioCodec;
};

/**
 * @brief One ffmpeg process fanned out to many subscribers
 *
 * Lives on the pool's thread, which owns the QProcess. Input is pulled from a
 * ByteSource by an ioThreadPool() worker and written to stdin through queued
 * calls, bounded by MAX_PENDING_INPUT bytes in flight. Output is split into
 * MP4 boxes: the boxes before the first moof form the init segment, and a
 * subscriber receives the init segment followed by fragments from the next
 * moof on.
 *
 * Output is paced by the slowest subscriber: once one has more than half of
 * its buffer queued, stdout is left unread and the feeder pauses until every
 * subscriber is back under a quarter. A subscriber that stays behind for
 * subscriberStallMs while another one keeps draining is dropped with
 * BufferOverflow.
 */
class TranscodeSession : public QObject {
    Q_OBJECT

public:
    TranscodeSession(const QString& infoHash, int fileIndex, const TranscodePlan& plan,
                     const Config::TranscodeSettings& settings, QObject* parent = nullptr);
    ~TranscodeSession() override;

    TranscodeSession(const TranscodeSession&) = delete;
    TranscodeSession& operator=(const TranscodeSession&) = delete;

    /**
     * @brief Starts the process and the input feeder
     *
     * Must be called on the session's thread. Waits at most startupTimeoutMs
     * for the process to start.
     * @return TranscodeFailed if the process could not be started
     */
    Expected<void, StreamError> start(const TranscodeCommand& command,
                                      std::shared_ptr<ByteSource> input);

    /**
     * @brief Adds a subscriber; thread-safe
     * @return The subscriber's output channel, or TranscodeFailed once the session has ended
     */
    Expected<std::shared_ptr<ByteChannel>, StreamError> subscribe(const QString& watcherId);

    /// Removes a subscriber; thread-safe. @return remaining subscriber count
    int unsubscribe(const QString& watcherId);

    /**
     * @brief Terminates the process; subscribers receive @p reason
     *
     * SIGTERM first, SIGKILL after killTimeoutMs. Session's thread only.
     */
    void stop(StreamError reason);

    QString id() const { return id_; }
    QString infoHash() const { return infoHash_; }
    int fileIndex() const { return fileIndex_; }
    bool isAccepting() const { return accepting_.load(); }
    int subscriberCount() const;
    QByteArray initSegment() const;
    TranscodeSessionInfo info() const;

    static constexpr qint64 MAX_PENDING_INPUT = 4 * 1024 * 1024;

signals:
    /// Emitted once, after every subscriber has been finished or failed
    void finished(const QString& sessionId, bool success);
    void subscriberDropped(const QString& sessionId, const QString& watcherId);

private slots:
    void onReadyReadOutput();
    void onReadyReadError();
    void onProcessFinished(int exitCode, QProcess::ExitStatus exitStatus);
    void onProcessError(QProcess::ProcessError error);
    void onBytesWritten(qint64 bytes);
    void onResumeCheck();

private:
    struct Subscriber {
        std::shared_ptr<ByteChannel> channel;
        bool aligned = false;
    };
    struct FeedState;

    void runFeeder();
    void writeInput(const QByteArray& chunk);
    void closeInput();
    void inputFailed(StreamError error);
    void distribute(const QList<Mp4Box>& boxes);
    void updateFlowControl();
    void dropStalledSubscribers();
    qint64 largestBacklog() const;
    void finishOutput();
    void complete(std::optional<StreamError> failure);

    QString id_;
    QString infoHash_;
    int fileIndex_;
    TranscodePlan plan_;
    Config::TranscodeSettings settings_;

    QProcess* process_ = nullptr;
    qint64 pid_ = 0;
    QElapsedTimer runtime_;
    Mp4FragmentParser parser_;
    QByteArray stderrTail_;
    QTimer* resumeTimer_;
    QElapsedTimer pausedFor_;
    bool paused_ = false;
    bool exited_ = false;

    std::shared_ptr<FeedState> feed_;
    QFuture<void> feeder_;

    mutable QMutex mutex_;
    QHash<QString, Subscriber> subscribers_;
    QByteArray initSegment_;
    bool initComplete_ = false;
    bool ended_ = false;
    std::optional<StreamError> stopReason_;
    std::atomic<bool> accepting_{false};
};

} // namespace Swarmcast
