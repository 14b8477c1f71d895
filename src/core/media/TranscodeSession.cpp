#include "TranscodeSession.hpp"
#include "../common/IoThreadPool.hpp"
#include "../common/Logger.hpp"

#include <QtConcurrent/QtConcurrent>
#include <QtCore/QTimer>
#include <QtCore/QUuid>
#include <QtCore/QWaitCondition>

#include <algorithm>

namespace Swarmcast {

namespace {
constexpr qint64 kFeedChunk = 256 * 1024;
constexpr qint64 kOutputChunk = 256 * 1024;
constexpr int kStderrTailBytes = 4096;
constexpr int kResumeCheckMs = 20;

qint64 highWaterBytes(const Config::TranscodeSettings& settings) {
    return settings.subscriberBufferBytes / 2;
}

qint64 lowWaterBytes(const Config::TranscodeSettings& settings) {
    return settings.subscriberBufferBytes / 4;
}
}

struct TranscodeSession::FeedState {
    QMutex mutex;
    QWaitCondition drained;
    qint64 pending = 0;
    bool paused = false;
    std::atomic<bool> stopped{false};
    std::shared_ptr<ByteSource> source;

    void setPaused(bool value) {
        QMutexLocker locker(&mutex);
        paused = value;
        drained.wakeAll();
    }

    void stop() {
        stopped.store(true);
        if (source) {
            source->cancel();
        }
        QMutexLocker locker(&mutex);
        drained.wakeAll();
    }
};

TranscodeSession::TranscodeSession(const QString& infoHash, int fileIndex, const TranscodePlan& plan,
                                   const Config::TranscodeSettings& settings, QObject* parent)
    : QObject(parent)
    , id_(QUuid::createUuid().toString(QUuid::WithoutBraces))
    , infoHash_(infoHash)
    , fileIndex_(fileIndex)
    , plan_(plan)
    , settings_(settings)
    , resumeTimer_(new QTimer(this))
    , feed_(std::make_shared<FeedState>()) {
    resumeTimer_->setInterval(kResumeCheckMs);
    connect(resumeTimer_, &QTimer::timeout, this, &TranscodeSession::onResumeCheck);
}

TranscodeSession::~TranscodeSession() {
    feed_->stop();
    feeder_.waitForFinished();

    if (process_ && process_->state() != QProcess::NotRunning) {
        process_->kill();
        process_->waitForFinished(settings_.killTimeoutMs);
    }

    QMutexLocker locker(&mutex_);
    for (auto& subscriber : subscribers_) {
        subscriber.channel->fail(StreamError::Cancelled);
    }
    subscribers_.clear();
}

Expected<void, StreamError> TranscodeSession::start(const TranscodeCommand& command,
                                                    std::shared_ptr<ByteSource> input) {
    feed_->source = std::move(input);

    process_ = new QProcess(this);
    process_->setReadChannel(QProcess::StandardOutput);
    process_->start(command.program, command.arguments);
    if (!process_->waitForStarted(settings_.startupTimeoutMs)) {
        SWARMCAST_ERROR("Transcoder {} failed to start within {} ms: {}",
                        command.program.toStdString(), settings_.startupTimeoutMs,
                        process_->errorString().toStdString());
        feed_->stop();
        QMutexLocker locker(&mutex_);
        ended_ = true;
        return makeUnexpected(StreamError::TranscodeFailed);
    }

    pid_ = process_->processId();
    runtime_.start();
    accepting_.store(true);

    connect(process_, &QProcess::readyReadStandardOutput, this, &TranscodeSession::onReadyReadOutput);
    connect(process_, &QProcess::readyReadStandardError, this, &TranscodeSession::onReadyReadError);
    connect(process_, QOverload<int, QProcess::ExitStatus>::of(&QProcess::finished),
            this, &TranscodeSession::onProcessFinished);
    connect(process_, &QProcess::errorOccurred, this, &TranscodeSession::onProcessError);
    connect(process_, &QProcess::bytesWritten, this, &TranscodeSession::onBytesWritten);

    QTimer::singleShot(settings_.maxRuntimeMs, this, [this]() {
        if (accepting_.load()) {
            SWARMCAST_WARN("Transcode {} reached the runtime ceiling of {} ms", id_.toStdString(), settings_.maxRuntimeMs);
            stop(StreamError::TranscodeFailed);
        }
    });

    feeder_ = QtConcurrent::run(ioThreadPool(), [this]() { runFeeder(); });

    SWARMCAST_INFO("Transcode {} started for {}#{} (pid {}, mode {})",
                   id_.toStdString(), infoHash_.toStdString(), fileIndex_, pid_,
                   transcodeModeName(plan_.mode).toStdString());
    return {};
}

void TranscodeSession::runFeeder() {
    auto feed = feed_;

    while (!feed->stopped.load()) {
        {
            QMutexLocker locker(&feed->mutex);
            while ((feed->pending > MAX_PENDING_INPUT || feed->paused) && !feed->stopped.load()) {
                feed->drained.wait(&feed->mutex, 250);
            }
        }
        if (feed->stopped.load()) {
            break;
        }

        auto chunk = feed->source->read(kFeedChunk);
        if (chunk.hasError()) {
            if (!feed->stopped.load()) {
                const StreamError error = chunk.error();
                QMetaObject::invokeMethod(this, [this, error]() { inputFailed(error); }, Qt::QueuedConnection);
            }
            break;
        }
        if (chunk.value().isEmpty()) {
            QMetaObject::invokeMethod(this, [this]() { closeInput(); }, Qt::QueuedConnection);
            break;
        }

        const QByteArray data = chunk.value();
        {
            QMutexLocker locker(&feed->mutex);
            feed->pending += data.size();
        }
        QMetaObject::invokeMethod(this, [this, data]() { writeInput(data); }, Qt::QueuedConnection);
    }
}

void TranscodeSession::writeInput(const QByteArray& chunk) {
    if (process_->state() == QProcess::Running && process_->write(chunk) == chunk.size()) {
        return;
    }
    // Not accepted; release its backpressure share
    onBytesWritten(chunk.size());
}

void TranscodeSession::closeInput() {
    SWARMCAST_DEBUG("Transcode {} input complete", id_.toStdString());
    process_->closeWriteChannel();
}

void TranscodeSession::inputFailed(StreamError error) {
    SWARMCAST_WARN("Transcode {} input failed: {}", id_.toStdString(), errorCode(error).toStdString());
    stop(error);
}

void TranscodeSession::onBytesWritten(qint64 bytes) {
    QMutexLocker locker(&feed_->mutex);
    feed_->pending = std::max<qint64>(0, feed_->pending - bytes);
    feed_->drained.wakeAll();
}

void TranscodeSession::onReadyReadOutput() {
    // While paused the output stays in the process buffer
    while (!paused_ && process_->bytesAvailable() > 0) {
        distribute(parser_.feed(process_->read(kOutputChunk)));
        updateFlowControl();
    }
    if (exited_ && !paused_ && process_->bytesAvailable() == 0) {
        finishOutput();
    }
}

void TranscodeSession::onReadyReadError() {
    stderrTail_.append(process_->readAllStandardError());
    if (stderrTail_.size() > kStderrTailBytes) {
        stderrTail_ = stderrTail_.right(kStderrTailBytes);
    }
}

void TranscodeSession::distribute(const QList<Mp4Box>& boxes) {
    QStringList dropped;
    {
        QMutexLocker locker(&mutex_);
        for (const Mp4Box& box : boxes) {
            const bool boundary = box.isFragmentStart() || box.type == "raw ";
            if (!initComplete_ && !boundary) {
                initSegment_.append(box.bytes);
                continue;
            }
            initComplete_ = true;

            for (auto it = subscribers_.begin(); it != subscribers_.end();) {
                Subscriber& subscriber = it.value();
                bool ok = true;
                if (!subscriber.aligned && boundary) {
                    ok = subscriber.channel->push(initSegment_);
                    subscriber.aligned = true;
                }
                if (ok && subscriber.aligned) {
                    ok = subscriber.channel->push(box.bytes);
                }
                if (!ok) {
                    dropped << it.key();
                    it = subscribers_.erase(it);
                } else {
                    ++it;
                }
            }
        }
    }

    for (const QString& watcherId : dropped) {
        SWARMCAST_WARN("Transcode {} dropped subscriber {} (buffer overflow)",
                       id_.toStdString(), watcherId.toStdString());
        emit subscriberDropped(id_, watcherId);
    }
}

qint64 TranscodeSession::largestBacklog() const {
    QMutexLocker locker(&mutex_);
    qint64 largest = 0;
    for (const Subscriber& subscriber : subscribers_) {
        largest = std::max(largest, subscriber.channel->queuedBytes());
    }
    return largest;
}

void TranscodeSession::updateFlowControl() {
    if (paused_) {
        return;
    }
    const qint64 backlog = largestBacklog();
    if (backlog <= highWaterBytes(settings_)) {
        return;
    }
    paused_ = true;
    pausedFor_.start();
    feed_->setPaused(true);
    resumeTimer_->start();
    SWARMCAST_DEBUG("Transcode {} paused, slowest subscriber has {} bytes queued", id_.toStdString(), backlog);
}

void TranscodeSession::onResumeCheck() {
    if (!paused_) {
        resumeTimer_->stop();
        return;
    }
    if (pausedFor_.elapsed() >= settings_.subscriberStallMs) {
        dropStalledSubscribers();
    }
    if (largestBacklog() > lowWaterBytes(settings_)) {
        return;
    }

    paused_ = false;
    resumeTimer_->stop();
    feed_->setPaused(false);
    SWARMCAST_DEBUG("Transcode {} resumed after {} ms", id_.toStdString(), pausedFor_.elapsed());
    onReadyReadOutput();
}

void TranscodeSession::dropStalledSubscribers() {
    const qint64 lowWater = lowWaterBytes(settings_);
    QStringList dropped;
    {
        QMutexLocker locker(&mutex_);
        const bool othersDraining = std::any_of(subscribers_.cbegin(), subscribers_.cend(),
                                                [lowWater](const Subscriber& subscriber) {
                                                    return subscriber.channel->queuedBytes() <= lowWater;
                                                });
        // A lone slow reader sets the pace instead
        if (!othersDraining) {
            return;
        }
        for (auto it = subscribers_.begin(); it != subscribers_.end();) {
            if (it->channel->queuedBytes() > lowWater) {
                it->channel->fail(StreamError::BufferOverflow);
                dropped << it.key();
                it = subscribers_.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (const QString& watcherId : dropped) {
        SWARMCAST_WARN("Transcode {} dropped subscriber {}, stalled for {} ms",
                       id_.toStdString(), watcherId.toStdString(), pausedFor_.elapsed());
        emit subscriberDropped(id_, watcherId);
    }
}

void TranscodeSession::onProcessFinished(int exitCode, QProcess::ExitStatus exitStatus) {
    std::optional<StreamError> failure = stopReason_;
    if (!failure && (exitStatus == QProcess::CrashExit || exitCode != 0)) {
        SWARMCAST_ERROR("Transcode {} exited with code {} ({}): {}",
                        id_.toStdString(), exitCode,
                        exitStatus == QProcess::CrashExit ? "crash" : "normal",
                        QString::fromUtf8(stderrTail_).trimmed().toStdString());
        failure = StreamError::TranscodeFailed;
    }
    if (failure) {
        complete(failure);
        return;
    }

    // Completes once the buffered output has been handed out
    exited_ = true;
    onReadyReadOutput();
}

void TranscodeSession::finishOutput() {
    distribute(parser_.flush());
    complete(std::nullopt);
}

void TranscodeSession::onProcessError(QProcess::ProcessError error) {
    if (error == QProcess::FailedToStart) {
        complete(StreamError::TranscodeFailed);
        return;
    }
    // Crashes also arrive through finished()
    SWARMCAST_DEBUG("Transcode {} process error {}: {}", id_.toStdString(),
                    static_cast<int>(error), process_->errorString().toStdString());
}

void TranscodeSession::stop(StreamError reason) {
    {
        QMutexLocker locker(&mutex_);
        if (ended_) {
            return;
        }
        if (!stopReason_) {
            stopReason_ = reason;
        }
    }
    accepting_.store(false);
    feed_->stop();

    if (!process_ || process_->state() == QProcess::NotRunning) {
        complete(reason);
        return;
    }

    SWARMCAST_INFO("Stopping transcode {} ({})", id_.toStdString(), errorCode(reason).toStdString());
    process_->terminate();
    QTimer::singleShot(settings_.killTimeoutMs, this, [this]() {
        if (process_->state() != QProcess::NotRunning) {
            SWARMCAST_WARN("Transcode {} ignored SIGTERM, killing", id_.toStdString());
            process_->kill();
        }
    });
}

void TranscodeSession::complete(std::optional<StreamError> failure) {
    {
        QMutexLocker locker(&mutex_);
        if (ended_) {
            return;
        }
        ended_ = true;
        for (auto& subscriber : subscribers_) {
            if (failure) {
                subscriber.channel->fail(*failure);
            } else {
                subscriber.channel->finish();
            }
        }
        subscribers_.clear();
    }
    accepting_.store(false);
    feed_->stop();
    resumeTimer_->stop();
    paused_ = false;

    SWARMCAST_INFO("Transcode {} ended after {} ms ({})", id_.toStdString(),
                   runtime_.isValid() ? runtime_.elapsed() : 0,
                   failure ? errorCode(*failure).toStdString() : std::string("ok"));
    emit finished(id_, !failure.has_value());
}

Expected<std::shared_ptr<ByteChannel>, StreamError> TranscodeSession::subscribe(const QString& watcherId) {
    QMutexLocker locker(&mutex_);
    if (ended_ || !accepting_.load()) {
        return makeUnexpected(StreamError::TranscodeFailed);
    }

    auto existing = subscribers_.find(watcherId);
    if (existing != subscribers_.end()) {
        existing->channel->cancel();
        subscribers_.erase(existing);
    }

    auto channel = std::make_shared<ByteChannel>(settings_.subscriberBufferBytes);
    subscribers_.insert(watcherId, Subscriber{channel, false});
    SWARMCAST_DEBUG("Transcode {} subscriber {} attached ({} total)",
                    id_.toStdString(), watcherId.toStdString(), subscribers_.size());
    return channel;
}

int TranscodeSession::unsubscribe(const QString& watcherId) {
    QMutexLocker locker(&mutex_);
    auto it = subscribers_.find(watcherId);
    if (it != subscribers_.end()) {
        it->channel->cancel();
        subscribers_.erase(it);
    }
    return subscribers_.size();
}

int TranscodeSession::subscriberCount() const {
    QMutexLocker locker(&mutex_);
    return subscribers_.size();
}

QByteArray TranscodeSession::initSegment() const {
    QMutexLocker locker(&mutex_);
    return initComplete_ ? initSegment_ : QByteArray();
}

TranscodeSessionInfo TranscodeSession::info() const {
    TranscodeSessionInfo info;
    info.id = id_;
    info.pid = pid_;
    info.infoHash = infoHash_;
    info.fileIndex = fileIndex_;
    info.runtimeMs = runtime_.isValid() ? runtime_.elapsed() : 0;
    info.subscribers = subscriberCount();
    info.mode = plan_.mode;
    info.inputVideoCodec = plan_.inputVideoCodec;
    info.inputAudioCodec = plan_.inputAudioCodec;
    return info;
}

} // namespace Swarmcast
