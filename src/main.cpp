#include <QtCore/QCommandLineParser>
#include <QtCore/QCoreApplication>
#include <QtCore/QDir>
#include <QtCore/QFileInfo>

#include <csignal>
#include <memory>

#include "core/common/Config.hpp"
#include "core/common/IoThreadPool.hpp"
#include "core/common/Logger.hpp"
#include "core/common/StreamError.hpp"
#include "core/common/TerminationSignals.hpp"
#include "core/media/FFmpegProbe.hpp"
#include "core/media/TranscodePool.hpp"
#include "core/security/RateLimiter.hpp"
#include "core/storage/CatalogStore.hpp"
#include "core/streaming/ConnectionStatus.hpp"
#include "core/streaming/StreamMultiplexer.hpp"
#include "core/streaming/WatcherRegistry.hpp"
#include "core/torrent/LibTorrentSwarmClient.hpp"
#include "core/torrent/MetadataResolver.hpp"
#include "server/StreamHttpServer.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("swarmcast-server");
    app.setApplicationVersion("1.0.0");
    app.setOrganizationName("Swarmcast");

    QCommandLineParser parser;
    parser.setApplicationDescription("Streams files of BitTorrent swarms to browsers over HTTP");
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption configOption({"c", "config"}, "INI configuration file.", "path");
    QCommandLineOption hostOption("host", "Address to listen on.", "address");
    QCommandLineOption portOption({"p", "port"}, "HTTP port.", "port");
    QCommandLineOption logLevelOption("log-level", "trace, debug, info, warn, error or critical.", "level");
    QCommandLineOption catalogOption("catalog", "JSON catalog with names, posters and codec info.", "path");
    parser.addOptions({configOption, hostOption, portOption, logLevelOption, catalogOption});
    parser.process(app);

    using namespace Swarmcast;

    try {
        if (parser.isSet(configOption)) {
            Config::instance().initializeFromFile(parser.value(configOption));
        } else {
            Config::instance().initialize();
        }

        const Config::LoggingSettings logging = Config::instance().getLoggingSettings();
        const QString levelName = parser.isSet(logLevelOption) ? parser.value(logLevelOption) : logging.level;
        Logger::instance().initialize(logging.filePath.toStdString(),
                                      Logger::levelFromString(levelName.toStdString()));
        Logger::instance().info("Starting swarmcast-server v{} (libtorrent {})",
                                app.applicationVersion().toStdString(),
                                LibTorrentSwarmClient::libtorrentVersion().toStdString());

        qRegisterMetaType<StreamError>("Swarmcast::StreamError");
        qRegisterMetaType<TorrentMetadata>("Swarmcast::TorrentMetadata");

        Config::ServerSettings serverSettings = Config::instance().getServerSettings();
        if (parser.isSet(hostOption)) {
            serverSettings.host = parser.value(hostOption);
        }
        if (parser.isSet(portOption)) {
            bool ok = false;
            const int port = parser.value(portOption).toInt(&ok);
            if (!ok || port < 0 || port > 65535) {
                Logger::instance().critical("Invalid port '{}'", parser.value(portOption).toStdString());
                return 2;
            }
            serverSettings.port = port;
        }

        const Config::StreamingSettings streamingSettings = Config::instance().getStreamingSettings();
        const Config::TranscodeSettings transcodeSettings = Config::instance().getTranscodeSettings();
        const Config::ProbeSettings probeSettings = Config::instance().getProbeSettings();

        // Transport
        LibTorrentSwarmClient swarmClient;
        auto started = swarmClient.initialize(Config::instance().getSwarmSettings());
        if (!started) {
            Logger::instance().critical("Swarm session failed to start: {}",
                                        errorMessage(started.error()).toStdString());
            return 1;
        }

        // Engine
        TranscodePool transcodePool(transcodeSettings);
        WatcherRegistry registry(&swarmClient, &transcodePool, streamingSettings);
        ConnectionStatusPublisher statusPublisher(&swarmClient, streamingSettings);
        MetadataResolver metadataResolver(&swarmClient,
                                          std::chrono::milliseconds(streamingSettings.metadataTimeoutMs));
        StreamMultiplexer multiplexer(&swarmClient, &registry, &transcodePool, &statusPublisher,
                                      streamingSettings);

        FFmpegProbe probe(probeSettings);
        if (probeSettings.enabled) {
            multiplexer.setProbe(&probe, probeSettings.maxBytes);
        }

        std::unique_ptr<JsonCatalogStore> catalog;
        const QString catalogPath = parser.isSet(catalogOption) ? parser.value(catalogOption)
                                                                : Config::instance().getCatalogSettings().catalogPath;
        if (!catalogPath.isEmpty()) {
            catalog = std::make_unique<JsonCatalogStore>();
            auto loaded = catalog->loadFile(catalogPath);
            if (!loaded) {
                Logger::instance().warn("Catalog {} not used: {}", catalogPath.toStdString(),
                                        catalogErrorString(loaded.error()).toStdString());
                catalog.reset();
            } else {
                multiplexer.setCatalog(catalog.get());
            }
        }

        const Config::RateLimitSettings rateSettings = Config::instance().getRateLimitSettings();
        RateLimitPresets limiters;
        if (rateSettings.enabled) {
            limiters = RateLimitPresets::fromSettings(rateSettings);
        }

        // HTTP
        ServerServices services;
        services.multiplexer = &multiplexer;
        services.metadataResolver = &metadataResolver;
        services.statusPublisher = &statusPublisher;
        services.registry = &registry;
        services.swarmClient = &swarmClient;
        services.transcodePool = &transcodePool;
        services.catalog = catalog.get();
        services.streamLimiter = limiters.stream.get();
        services.metadataLimiter = limiters.metadata.get();

        StreamHttpServer server(services, serverSettings);
        auto listening = server.listen();
        if (!listening) {
            Logger::instance().critical("HTTP server failed to start: {}", listening.error().toStdString());
            swarmClient.shutdown();
            return 1;
        }

        TerminationSignals terminationSignals;
        QObject::connect(&terminationSignals, &TerminationSignals::received, &app, &QCoreApplication::quit);
        if (!terminationSignals.install({SIGINT, SIGTERM})) {
            Logger::instance().warn("Could not install SIGINT and SIGTERM handlers");
        }

        Logger::instance().info("Ready on port {} (max {} streams, {} transcodes)", listening.value(),
                                streamingSettings.maxConcurrentStreams, transcodeSettings.maxProcesses);

        const int result = app.exec();

        // Readers blocked on pieces wake when the session goes, so it goes last
        Logger::instance().info("Shutting down");
        server.close();
        registry.shutdown();
        transcodePool.terminateAll();
        swarmClient.shutdown();

        // Workers hold pointers to everything above, so nothing is destroyed before they return
        drainIoThreadPool();
        Logger::instance().info("Shutdown complete");
        return result;

    } catch (const std::exception& e) {
        Logger::instance().critical("Fatal error during startup: {}", e.what());
        return -1;
    }
}
