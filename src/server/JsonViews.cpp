#include "JsonViews.hpp"
#include "../core/media/CodecClassifier.hpp"

#include <QtCore/QDateTime>
#include <QtCore/QJsonArray>

namespace Swarmcast {

namespace JsonViews {

QJsonObject error(StreamError error) {
    QJsonObject json;
    json["error"] = errorCode(error);
    json["message"] = errorMessage(error);
    json["retryable"] = isRetryable(error);
    return json;
}

QJsonObject metadata(const TorrentMetadata& metadata, const std::optional<CatalogEntry>& catalogEntry) {
    QJsonObject json;
    json["infoHash"] = metadata.infoHash;
    json["name"] = metadata.name;
    json["totalSize"] = static_cast<double>(metadata.totalSize);
    json["pieceLength"] = metadata.pieceLength;
    json["pieceCount"] = metadata.pieceCount;
    json["fileCount"] = static_cast<int>(metadata.files.size());

    if (catalogEntry) {
        if (!catalogEntry->displayName.isEmpty()) {
            json["name"] = catalogEntry->displayName;
        }
        if (!catalogEntry->posterUrl.isEmpty()) {
            json["poster"] = catalogEntry->posterUrl;
        }
    }

    QJsonArray files;
    for (const SwarmFile& file : metadata.files) {
        std::optional<ProbedCodecs> stored;
        if (catalogEntry) {
            stored = catalogEntry->codecsFor(file.index);
        }
        const CodecProfile profile = CodecClassifier::classify(file.name, stored);

        QJsonObject fileJson;
        fileJson["index"] = file.index;
        fileJson["name"] = file.name;
        fileJson["path"] = file.path;
        fileJson["length"] = static_cast<double>(file.length);
        fileJson["mediaKind"] = mediaKindName(profile.mediaKind);
        fileJson["mimeType"] = CodecClassifier::mimeTypeFor(file.name);
        fileJson["needsTranscoding"] = profile.needsTranscoding;
        fileJson["transcodeMode"] = transcodeModeName(profile.mode);
        if (!profile.videoCodec.isEmpty()) {
            fileJson["videoCodec"] = profile.videoCodec;
        }
        if (!profile.audioCodec.isEmpty()) {
            fileJson["audioCodec"] = profile.audioCodec;
        }
        files.append(fileJson);
    }
    json["files"] = files;
    return json;
}

QJsonObject swarmStats(const SwarmStats& stats) {
    QJsonObject json;
    json["infoHash"] = stats.infoHash;
    json["name"] = stats.name;
    json["hasMetadata"] = stats.hasMetadata;
    json["peers"] = stats.numPeers;
    json["seeders"] = stats.numSeeds;
    json["leechers"] = stats.numLeechers;
    json["downloadSpeed"] = static_cast<double>(stats.downloadRate);
    json["uploadSpeed"] = static_cast<double>(stats.uploadRate);
    json["progress"] = stats.progress;
    json["downloaded"] = static_cast<double>(stats.downloaded);
    json["uploaded"] = static_cast<double>(stats.uploaded);
    return json;
}

QJsonObject registry(const RegistryDebugInfo& info) {
    QJsonObject json;
    json["activeStreams"] = info.activeStreams;
    json["activeTorrents"] = info.activeTorrents;
    json["totalWatchers"] = info.totalWatchers;

    QJsonArray files;
    for (const FileWatchInfo& file : info.files) {
        QJsonObject fileJson;
        fileJson["infoHash"] = file.infoHash;
        fileJson["fileIndex"] = file.fileIndex;
        fileJson["watchers"] = file.watchers;
        fileJson["hasCleanupTimer"] = file.hasCleanupTimer;
        files.append(fileJson);
    }
    json["files"] = files;
    return json;
}

QJsonObject transcodePool(const TranscodePoolStats& stats) {
    QJsonObject json;
    json["activeProcesses"] = stats.activeProcesses;
    json["maxProcesses"] = stats.maxProcesses;
    json["queued"] = stats.queuedAcquirers;

    QJsonArray sessions;
    for (const TranscodeSessionInfo& info : stats.sessions) {
        QJsonObject session;
        session["id"] = info.id;
        session["pid"] = static_cast<double>(info.pid);
        session["infoHash"] = info.infoHash;
        session["fileIndex"] = info.fileIndex;
        session["runtimeMs"] = static_cast<double>(info.runtimeMs);
        session["subscribers"] = info.subscribers;
        session["mode"] = transcodeModeName(info.mode);
        session["inputVideoCodec"] = info.inputVideoCodec;
        session["inputAudioCodec"] = info.inputAudioCodec;
        sessions.append(session);
    }
    json["sessions"] = sessions;
    return json;
}

QJsonObject health(const DhtStatus& dht, const QList<SwarmStats>& swarms,
                   const RegistryDebugInfo& registryInfo, const TranscodePoolStats& poolStats) {
    QJsonObject json;
    json["status"] = dht.ready ? QStringLiteral("ok") : QStringLiteral("degraded");
    json["timestamp"] = QDateTime::currentDateTimeUtc().toString(Qt::ISODate);

    QJsonObject dhtJson;
    dhtJson["ready"] = dht.ready;
    dhtJson["nodes"] = dht.nodeCount;
    json["dht"] = dhtJson;

    QJsonArray torrents;
    for (const SwarmStats& stats : swarms) {
        torrents.append(swarmStats(stats));
    }
    json["torrents"] = torrents;
    json["watchers"] = registry(registryInfo);
    json["transcode"] = transcodePool(poolStats);
    return json;
}

} // namespace JsonViews

} // namespace Swarmcast
