#pragma once

#include <QtCore/QSettings>
#include <QtCore/QStandardPaths>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QVariant>
#include <QtCore/QReadWriteLock>
#include <memory>

namespace Swarmcast {

class Config {
public:
    static Config& instance();

    void initialize(const QString& organizationName = "Swarmcast",
                    const QString& applicationName = "swarmcast-server");

    /// Reads settings from an INI file instead of the platform location
    void initializeFromFile(const QString& iniPath);

    // General settings
    QVariant getValue(const QString& key, const QVariant& defaultValue = QVariant()) const;
    void setValue(const QString& key, const QVariant& value);

    // Typed convenience methods
    QString getString(const QString& key, const QString& defaultValue = QString()) const;
    int getInt(const QString& key, int defaultValue = 0) const;
    bool getBool(const QString& key, bool defaultValue = false) const;
    double getDouble(const QString& key, double defaultValue = 0.0) const;

    struct ServerSettings {
        QString host = "0.0.0.0";
        int port = 8080;
        bool trustForwardedFor = false;
        QString corsOrigin = "*";
        int sseKeepAliveMs = 15000;
    };

    struct SwarmSettings {
        QString downloadPath;
        QString listenInterfaces = "0.0.0.0:6881,[::]:6881";
        int maxConnections = 200;
        int maxConnectionsPerTorrent = 50;
        int uploadRateLimit = -1;   // KiB/s, -1 = unlimited
        int downloadRateLimit = -1;
        bool enableDHT = true;
        bool enableLSD = true;
        bool enableUPnP = false;
        bool enableNATPMP = false;
        QStringList trackers;
        QStringList dhtBootstrapNodes;
        int pieceTimeoutMs = 60000;
        int readaheadBytes = 8 * 1024 * 1024;
        int pieceCacheBytes = 64 * 1024 * 1024;
    };

    struct StreamingSettings {
        int metadataTimeoutMs = 120000;
        int firstByteTimeoutMs = 120000;
        int cleanupGraceMs = 60000;
        int maxConcurrentStreams = 20;
        int statusPollIntervalMs = 500;
        qint64 minVideoBufferBytes = 20LL * 1024 * 1024;
        qint64 minAudioBufferBytes = 4LL * 1024 * 1024;
    };

    struct TranscodeSettings {
        QString ffmpegPath = "ffmpeg";
        int maxProcesses = 3;
        int queueWaitMs = 5000;
        int startupTimeoutMs = 10000;
        int graceMs = 15000;
        int maxRuntimeMs = 4 * 60 * 60 * 1000;
        int killTimeoutMs = 5000;
        QString preset = "fast";
        int crf = 23;
        QString maxVideoBitrate = "2000k";
        QString audioBitrate = "128k";
        int subscriberBufferBytes = 32 * 1024 * 1024;
        int subscriberStallMs = 20000;
    };

    struct ProbeSettings {
        bool enabled = true;
        int maxBytes = 10 * 1024 * 1024;
        int timeoutMs = 15000;
    };

    struct RateLimitSettings {
        bool enabled = true;
        int streamRequestsPerWindow = 50;
        int metadataRequestsPerWindow = 30;
        int windowMs = 60000;
    };

    struct CatalogSettings {
        QString catalogPath;
    };

    struct LoggingSettings {
        QString filePath = "swarmcast.log";
        QString level = "info";
    };

    ServerSettings getServerSettings() const;
    SwarmSettings getSwarmSettings() const;
    StreamingSettings getStreamingSettings() const;
    TranscodeSettings getTranscodeSettings() const;
    ProbeSettings getProbeSettings() const;
    RateLimitSettings getRateLimitSettings() const;
    CatalogSettings getCatalogSettings() const;
    LoggingSettings getLoggingSettings() const;

    void setServerSettings(const ServerSettings& settings);
    void setStreamingSettings(const StreamingSettings& settings);
    void setTranscodeSettings(const TranscodeSettings& settings);

    // Paths
    QString getDataPath() const;
    QString getCachePath() const;

    void sync();

private:
    Config() = default;
    std::unique_ptr<QSettings> settings_;
    mutable QReadWriteLock lock_;

    void ensureDirectoriesExist();
};

} // namespace Swarmcast
