#include "Config.hpp"
#include "Logger.hpp"
#include <QtCore/QDir>

namespace Swarmcast {

namespace {

const QStringList kOpenTrackers = {
    "http://tracker.opentrackr.org:1337/announce",
    "http://open.tracker.cl:1337/announce",
    "http://tracker.torrent.eu.org:451/announce",
    "http://tracker.dler.org:6969/announce",
    "udp://tracker.opentrackr.org:1337/announce",
    "udp://open.stealth.si:80/announce",
    "udp://tracker.torrent.eu.org:451/announce",
    "udp://exodus.desync.com:6969/announce",
    "udp://open.demonii.com:1337/announce",
    "udp://explodie.org:6969/announce"
};

const QStringList kBootstrapNodes = {
    "router.bittorrent.com:6881",
    "router.utorrent.com:6881",
    "dht.transmissionbt.com:6881",
    "dht.libtorrent.org:25401"
};

} // namespace

Config& Config::instance() {
    static Config instance;
    return instance;
}

void Config::initialize(const QString& organizationName, const QString& applicationName) {
    {
        QWriteLocker locker(&lock_);
        settings_ = std::make_unique<QSettings>(organizationName, applicationName);
    }
    ensureDirectoriesExist();
    SWARMCAST_INFO("Config initialized for {}/{}",
                   organizationName.toStdString(), applicationName.toStdString());
}

void Config::initializeFromFile(const QString& iniPath) {
    {
        QWriteLocker locker(&lock_);
        settings_ = std::make_unique<QSettings>(iniPath, QSettings::IniFormat);
    }
    ensureDirectoriesExist();
    SWARMCAST_INFO("Config loaded from {}", iniPath.toStdString());
}

QVariant Config::getValue(const QString& key, const QVariant& defaultValue) const {
    QReadLocker locker(&lock_);
    if (!settings_) return defaultValue;
    return settings_->value(key, defaultValue);
}

void Config::setValue(const QString& key, const QVariant& value) {
    QWriteLocker locker(&lock_);
    if (settings_) {
        settings_->setValue(key, value);
    }
}

QString Config::getString(const QString& key, const QString& defaultValue) const {
    return getValue(key, defaultValue).toString();
}

int Config::getInt(const QString& key, int defaultValue) const {
    return getValue(key, defaultValue).toInt();
}

bool Config::getBool(const QString& key, bool defaultValue) const {
    return getValue(key, defaultValue).toBool();
}

double Config::getDouble(const QString& key, double defaultValue) const {
    return getValue(key, defaultValue).toDouble();
}

Config::ServerSettings Config::getServerSettings() const {
    ServerSettings settings;
    settings.host = getString("server/host", settings.host);
    settings.port = getInt("server/port", settings.port);
    settings.trustForwardedFor = getBool("server/trustForwardedFor", settings.trustForwardedFor);
    settings.corsOrigin = getString("server/corsOrigin", settings.corsOrigin);
    settings.sseKeepAliveMs = getInt("server/sseKeepAliveMs", settings.sseKeepAliveMs);
    return settings;
}

Config::SwarmSettings Config::getSwarmSettings() const {
    SwarmSettings settings;
    settings.downloadPath = getString("swarm/downloadPath", getCachePath() + "/torrents");
    settings.listenInterfaces = getString("swarm/listenInterfaces", settings.listenInterfaces);
    settings.maxConnections = getInt("swarm/maxConnections", settings.maxConnections);
    settings.maxConnectionsPerTorrent = getInt("swarm/maxConnectionsPerTorrent", settings.maxConnectionsPerTorrent);
    settings.uploadRateLimit = getInt("swarm/uploadRateLimit", settings.uploadRateLimit);
    settings.downloadRateLimit = getInt("swarm/downloadRateLimit", settings.downloadRateLimit);
    settings.enableDHT = getBool("swarm/enableDHT", settings.enableDHT);
    settings.enableLSD = getBool("swarm/enableLSD", settings.enableLSD);
    settings.enableUPnP = getBool("swarm/enableUPnP", settings.enableUPnP);
    settings.enableNATPMP = getBool("swarm/enableNATPMP", settings.enableNATPMP);
    settings.trackers = getValue("swarm/trackers", kOpenTrackers).toStringList();
    settings.dhtBootstrapNodes = getValue("swarm/dhtBootstrapNodes", kBootstrapNodes).toStringList();
    settings.pieceTimeoutMs = getInt("swarm/pieceTimeoutMs", settings.pieceTimeoutMs);
    settings.readaheadBytes = getInt("swarm/readaheadBytes", settings.readaheadBytes);
    settings.pieceCacheBytes = getInt("swarm/pieceCacheBytes", settings.pieceCacheBytes);
    return settings;
}

Config::StreamingSettings Config::getStreamingSettings() const {
    StreamingSettings settings;
    settings.metadataTimeoutMs = getInt("streaming/metadataTimeoutMs", settings.metadataTimeoutMs);
    settings.firstByteTimeoutMs = getInt("streaming/firstByteTimeoutMs", settings.firstByteTimeoutMs);
    settings.cleanupGraceMs = getInt("streaming/cleanupGraceMs", settings.cleanupGraceMs);
    settings.maxConcurrentStreams = getInt("streaming/maxConcurrentStreams", settings.maxConcurrentStreams);
    settings.statusPollIntervalMs = getInt("streaming/statusPollIntervalMs", settings.statusPollIntervalMs);
    settings.minVideoBufferBytes = getValue("streaming/minVideoBufferBytes", settings.minVideoBufferBytes).toLongLong();
    settings.minAudioBufferBytes = getValue("streaming/minAudioBufferBytes", settings.minAudioBufferBytes).toLongLong();
    return settings;
}

Config::TranscodeSettings Config::getTranscodeSettings() const {
    TranscodeSettings settings;
    settings.ffmpegPath = getString("transcode/ffmpegPath", settings.ffmpegPath);
    settings.maxProcesses = getInt("transcode/maxProcesses", settings.maxProcesses);
    settings.queueWaitMs = getInt("transcode/queueWaitMs", settings.queueWaitMs);
    settings.startupTimeoutMs = getInt("transcode/startupTimeoutMs", settings.startupTimeoutMs);
    settings.graceMs = getInt("transcode/graceMs", settings.graceMs);
    settings.maxRuntimeMs = getInt("transcode/maxRuntimeMs", settings.maxRuntimeMs);
    settings.killTimeoutMs = getInt("transcode/killTimeoutMs", settings.killTimeoutMs);
    settings.preset = getString("transcode/preset", settings.preset);
    settings.crf = getInt("transcode/crf", settings.crf);
    settings.maxVideoBitrate = getString("transcode/maxVideoBitrate", settings.maxVideoBitrate);
    settings.audioBitrate = getString("transcode/audioBitrate", settings.audioBitrate);
    settings.subscriberBufferBytes = getInt("transcode/subscriberBufferBytes", settings.subscriberBufferBytes);
    settings.subscriberStallMs = getInt("transcode/subscriberStallMs", settings.subscriberStallMs);
    return settings;
}

Config::ProbeSettings Config::getProbeSettings() const {
    ProbeSettings settings;
    settings.enabled = getBool("probe/enabled", settings.enabled);
    settings.maxBytes = getInt("probe/maxBytes", settings.maxBytes);
    settings.timeoutMs = getInt("probe/timeoutMs", settings.timeoutMs);
    return settings;
}

Config::RateLimitSettings Config::getRateLimitSettings() const {
    RateLimitSettings settings;
    settings.enabled = getBool("rateLimit/enabled", settings.enabled);
    settings.streamRequestsPerWindow = getInt("rateLimit/streamRequestsPerWindow", settings.streamRequestsPerWindow);
    settings.metadataRequestsPerWindow = getInt("rateLimit/metadataRequestsPerWindow", settings.metadataRequestsPerWindow);
    settings.windowMs = getInt("rateLimit/windowMs", settings.windowMs);
    return settings;
}

Config::CatalogSettings Config::getCatalogSettings() const {
    CatalogSettings settings;
    settings.catalogPath = getString("catalog/path", getDataPath() + "/catalog.json");
    return settings;
}

Config::LoggingSettings Config::getLoggingSettings() const {
    LoggingSettings settings;
    settings.filePath = getString("logging/filePath", settings.filePath);
    settings.level = getString("logging/level", settings.level);
    return settings;
}

void Config::setServerSettings(const ServerSettings& settings) {
    setValue("server/host", settings.host);
    setValue("server/port", settings.port);
    setValue("server/trustForwardedFor", settings.trustForwardedFor);
    setValue("server/corsOrigin", settings.corsOrigin);
    setValue("server/sseKeepAliveMs", settings.sseKeepAliveMs);
}

void Config::setStreamingSettings(const StreamingSettings& settings) {
    setValue("streaming/metadataTimeoutMs", settings.metadataTimeoutMs);
    setValue("streaming/firstByteTimeoutMs", settings.firstByteTimeoutMs);
    setValue("streaming/cleanupGraceMs", settings.cleanupGraceMs);
    setValue("streaming/maxConcurrentStreams", settings.maxConcurrentStreams);
    setValue("streaming/statusPollIntervalMs", settings.statusPollIntervalMs);
    setValue("streaming/minVideoBufferBytes", settings.minVideoBufferBytes);
    setValue("streaming/minAudioBufferBytes", settings.minAudioBufferBytes);
}

void Config::setTranscodeSettings(const TranscodeSettings& settings) {
    setValue("transcode/ffmpegPath", settings.ffmpegPath);
    setValue("transcode/maxProcesses", settings.maxProcesses);
    setValue("transcode/queueWaitMs", settings.queueWaitMs);
    setValue("transcode/startupTimeoutMs", settings.startupTimeoutMs);
    setValue("transcode/graceMs", settings.graceMs);
    setValue("transcode/maxRuntimeMs", settings.maxRuntimeMs);
    setValue("transcode/killTimeoutMs", settings.killTimeoutMs);
    setValue("transcode/preset", settings.preset);
    setValue("transcode/crf", settings.crf);
    setValue("transcode/maxVideoBitrate", settings.maxVideoBitrate);
    setValue("transcode/audioBitrate", settings.audioBitrate);
    setValue("transcode/subscriberBufferBytes", settings.subscriberBufferBytes);
    setValue("transcode/subscriberStallMs", settings.subscriberStallMs);
}

QString Config::getDataPath() const {
    return QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
}

QString Config::getCachePath() const {
    return QStandardPaths::writableLocation(QStandardPaths::CacheLocation);
}

void Config::sync() {
    QWriteLocker locker(&lock_);
    if (settings_) {
        settings_->sync();
    }
}

void Config::ensureDirectoriesExist() {
    QDir dir;
    dir.mkpath(getDataPath());
    dir.mkpath(getCachePath());
    dir.mkpath(getSwarmSettings().downloadPath);
}

} // namespace Swarmcast
