#include "ConnectionStatus.hpp"
#include "../common/Logger.hpp"

#include <QtCore/QDateTime>
#include <QtCore/QDeadlineTimer>

#include <algorithm>

namespace Swarmcast {

QString stageName(ConnectionStage stage) {
    switch (stage) {
        case ConnectionStage::Initializing:        return QStringLiteral("initializing");
        case ConnectionStage::Connecting:          return QStringLiteral("connecting");
        case ConnectionStage::SearchingPeers:      return QStringLiteral("searching_peers");
        case ConnectionStage::DownloadingMetadata: return QStringLiteral("downloading_metadata");
        case ConnectionStage::Buffering:           return QStringLiteral("buffering");
        case ConnectionStage::Ready:               return QStringLiteral("ready");
        case ConnectionStage::Error:               return QStringLiteral("error");
    }
    return QStringLiteral("error");
}

bool isTerminalStage(ConnectionStage stage) {
    return stage == ConnectionStage::Ready || stage == ConnectionStage::Error;
}

bool ConnectionStatus::sameFigures(const ConnectionStatus& other) const {
    return stage == other.stage
        && numPeers == other.numPeers
        && qFuzzyCompare(1.0 + progress, 1.0 + other.progress)
        && qFuzzyCompare(2.0 + fileProgress, 2.0 + other.fileProgress)
        && downloadSpeed == other.downloadSpeed
        && uploadSpeed == other.uploadSpeed
        && downloaded == other.downloaded
        && uploaded == other.uploaded
        && fileReady == other.fileReady;
}

QJsonObject ConnectionStatus::toJson() const {
    QJsonObject json;
    json["stage"] = stageName(stage);
    json["message"] = message;
    json["numPeers"] = numPeers;
    json["progress"] = progress;
    if (fileProgress >= 0.0) {
        json["fileProgress"] = fileProgress;
    }
    json["downloadSpeed"] = downloadSpeed;
    json["uploadSpeed"] = uploadSpeed;
    json["downloaded"] = downloaded;
    json["uploaded"] = uploaded;
    json["ready"] = ready();
    json["fileReady"] = fileReady;
    if (fileIndex >= 0) {
        json["fileIndex"] = fileIndex;
    }
    json["timestamp"] = timestamp;
    return json;
}

StatusReader::StatusReader(std::shared_ptr<StatusChannel> channel)
    : channel_(std::move(channel)) {
}

StatusReader::Read StatusReader::next(int timeoutMs) {
    QMutexLocker locker(&channel_->mutex_);
    QDeadlineTimer deadline(timeoutMs);

    while (queue_.isEmpty() && !terminalSeen_ && !channel_->closed_) {
        if (!channel_->changed_.wait(&channel_->mutex_, deadline)) {
            return Read{Result::Timeout, ConnectionStatus()};
        }
    }

    if (queue_.isEmpty()) {
        return Read{Result::Ended, ConnectionStatus()};
    }

    ConnectionStatus status = queue_.dequeue();
    if (isTerminalStage(status.stage)) {
        terminalSeen_ = true;
        queue_.clear();
    }
    return Read{Result::Event, status};
}

StatusChannel::StatusChannel(const QString& watcherId)
    : watcherId_(watcherId) {
}

bool StatusChannel::publish(const ConnectionStatus& status) {
    QMutexLocker locker(&mutex_);
    if (closed_) {
        return false;
    }
    if (current_) {
        if (isTerminalStage(current_->stage)) {
            return false;
        }
        if (status.stage != ConnectionStage::Error && status.stage < current_->stage) {
            return false;
        }
    }

    current_ = status;
    for (auto it = readers_.begin(); it != readers_.end();) {
        if (auto reader = it->lock()) {
            reader->queue_.enqueue(status);
            ++it;
        } else {
            it = readers_.erase(it);
        }
    }
    changed_.wakeAll();
    return true;
}

std::shared_ptr<StatusReader> StatusChannel::subscribe() {
    auto reader = std::make_shared<StatusReader>(shared_from_this());
    QMutexLocker locker(&mutex_);
    if (current_) {
        reader->queue_.enqueue(*current_);
    }
    readers_.append(reader);
    return reader;
}

void StatusChannel::close() {
    QMutexLocker locker(&mutex_);
    closed_ = true;
    changed_.wakeAll();
}

std::optional<ConnectionStatus> StatusChannel::current() const {
    QMutexLocker locker(&mutex_);
    return current_;
}

bool StatusChannel::isClosed() const {
    QMutexLocker locker(&mutex_);
    return closed_;
}

ConnectionStatusPublisher::ConnectionStatusPublisher(SwarmClient* swarmClient,
                                                     const Config::StreamingSettings& settings,
                                                     QObject* parent)
    : QObject(parent)
    , swarmClient_(swarmClient)
    , settings_(settings)
    , pollTimer_(new QTimer(this)) {
    pollTimer_->setInterval(settings_.statusPollIntervalMs);
    connect(pollTimer_, &QTimer::timeout, this, &ConnectionStatusPublisher::poll);
    pollTimer_->start();
}

ConnectionStatusPublisher::~ConnectionStatusPublisher() {
    QMutexLocker locker(&mutex_);
    for (const Tracked& tracked : tracked_) {
        tracked.channel->close();
    }
    tracked_.clear();
}

void ConnectionStatusPublisher::track(const QString& watcherId, const SwarmHandle& swarm, int fileIndex) {
    Tracked tracked;
    tracked.swarm = swarm;
    tracked.fileIndex = fileIndex;
    tracked.channel = std::make_shared<StatusChannel>(watcherId);
    {
        QMutexLocker locker(&mutex_);
        tracked_.insert(watcherId, tracked);
    }
    publishFor(tracked);
}

void ConnectionStatusPublisher::setFileInfo(const QString& watcherId, qint64 fileLength, MediaKind kind) {
    QMutexLocker locker(&mutex_);
    auto it = tracked_.find(watcherId);
    if (it != tracked_.end()) {
        it->fileLength = fileLength;
        it->kind = kind;
    }
}

void ConnectionStatusPublisher::publishError(const QString& watcherId, StreamError error) {
    std::shared_ptr<StatusChannel> channel;
    int fileIndex = -1;
    {
        QMutexLocker locker(&mutex_);
        auto it = tracked_.constFind(watcherId);
        if (it == tracked_.constEnd()) {
            return;
        }
        channel = it->channel;
        fileIndex = it->fileIndex;
    }

    ConnectionStatus status;
    if (auto current = channel->current()) {
        status = *current;
    }
    status.stage = ConnectionStage::Error;
    status.message = QStringLiteral("Connection error: %1").arg(errorMessage(error));
    status.fileIndex = fileIndex;
    status.timestamp = QDateTime::currentMSecsSinceEpoch();
    channel->publish(status);
}

void ConnectionStatusPublisher::untrack(const QString& watcherId) {
    std::shared_ptr<StatusChannel> channel;
    {
        QMutexLocker locker(&mutex_);
        auto it = tracked_.find(watcherId);
        if (it == tracked_.end()) {
            return;
        }
        channel = it->channel;
        tracked_.erase(it);
    }
    channel->close();
}

std::shared_ptr<StatusReader> ConnectionStatusPublisher::subscribe(const QString& watcherId) {
    QMutexLocker locker(&mutex_);
    auto it = tracked_.constFind(watcherId);
    if (it == tracked_.constEnd()) {
        return nullptr;
    }
    return it->channel->subscribe();
}

std::optional<ConnectionStatus> ConnectionStatusPublisher::current(const QString& watcherId) const {
    QMutexLocker locker(&mutex_);
    auto it = tracked_.constFind(watcherId);
    if (it == tracked_.constEnd()) {
        return std::nullopt;
    }
    return it->channel->current();
}

void ConnectionStatusPublisher::poll() {
    QList<QString> ids;
    QList<Tracked> snapshot;
    {
        QMutexLocker locker(&mutex_);
        ids = tracked_.keys();
        snapshot = tracked_.values();
    }

    for (int i = 0; i < snapshot.size(); ++i) {
        Tracked& tracked = snapshot[i];
        if (tracked.fileLength < 0) {
            // Non-blocking once metadata is known
            auto metadata = swarmClient_->waitForMetadata(tracked.swarm, std::chrono::milliseconds(0));
            if (metadata) {
                for (const SwarmFile& file : metadata.value().files) {
                    if (file.index == tracked.fileIndex) {
                        setFileInfo(ids.at(i), file.length, CodecClassifier::mediaKindFor(file.name));
                        tracked.fileLength = file.length;
                        tracked.kind = CodecClassifier::mediaKindFor(file.name);
                        break;
                    }
                }
            }
        }
        publishFor(tracked);
    }
}

void ConnectionStatusPublisher::publishFor(const Tracked& tracked) {
    ConnectionStatus status = derive(swarmClient_->stats(tracked.swarm.infoHash), swarmClient_->dhtStatus(),
                                     tracked.fileIndex, tracked.fileLength, tracked.kind, settings_);
    auto current = tracked.channel->current();
    if (current && current->sameFigures(status)) {
        return;
    }
    if (tracked.channel->publish(status) && (!current || current->stage != status.stage)) {
        SWARMCAST_DEBUG("Watcher {} -> {}", tracked.channel->watcherId().toStdString(),
                        stageName(status.stage).toStdString());
    }
}

bool ConnectionStatusPublisher::isFileReady(qint64 bytesDone, qint64 fileLength, MediaKind kind,
                                            const Config::StreamingSettings& settings) {
    if (fileLength < 0) {
        return false;
    }
    if (bytesDone >= fileLength) {
        return true;
    }
    const qint64 threshold = kind == MediaKind::Audio ? settings.minAudioBufferBytes
                                                      : settings.minVideoBufferBytes;
    return bytesDone >= threshold;
}

ConnectionStatus ConnectionStatusPublisher::derive(const std::optional<SwarmStats>& stats, const DhtStatus& dht,
                                                   int fileIndex, qint64 fileLength, MediaKind kind,
                                                   const Config::StreamingSettings& settings) {
    ConnectionStatus status;
    status.fileIndex = fileIndex;
    status.timestamp = QDateTime::currentMSecsSinceEpoch();

    if (!stats) {
        status.stage = ConnectionStage::Initializing;
        status.message = QStringLiteral("Initializing torrent...");
        return status;
    }

    status.numPeers = stats->numPeers;
    status.progress = stats->progress;
    status.downloadSpeed = stats->downloadRate;
    status.uploadSpeed = stats->uploadRate;
    status.downloaded = stats->downloaded;
    status.uploaded = stats->uploaded;

    qint64 bytesDone = 0;
    if (fileIndex >= 0 && fileIndex < stats->fileBytesDone.size()) {
        bytesDone = stats->fileBytesDone.at(fileIndex);
    }
    if (fileLength > 0) {
        status.fileProgress = std::min(1.0, static_cast<double>(bytesDone) / static_cast<double>(fileLength));
    }
    status.fileReady = stats->hasMetadata && isFileReady(bytesDone, fileLength, kind, settings);

    if (!stats->hasMetadata) {
        if (stats->numPeers > 0) {
            status.stage = ConnectionStage::DownloadingMetadata;
            status.message = QStringLiteral("Downloading metadata (%1 peer%2)...")
                .arg(stats->numPeers).arg(QLatin1String(stats->numPeers == 1 ? "" : "s"));
        } else if (dht.ready) {
            status.stage = ConnectionStage::SearchingPeers;
            status.message = QStringLiteral("Searching for peers...");
        } else {
            status.stage = ConnectionStage::Connecting;
            status.message = QStringLiteral("Connecting to trackers...");
        }
    } else if (status.fileReady) {
        status.stage = ConnectionStage::Ready;
        status.message = QStringLiteral("Ready (%1 peers)").arg(stats->numPeers);
    } else {
        status.stage = ConnectionStage::Buffering;
        status.message = QStringLiteral("Buffering (%1 peers)...").arg(stats->numPeers);
    }
    return status;
}

} // namespace Swarmcast
