#include <QtTest/QtTest>
#include <QtConcurrent/QtConcurrent>
#include "../src/core/media/TranscodePool.hpp"
#include "../src/core/storage/CatalogStore.hpp"
#include "../src/core/streaming/ConnectionStatus.hpp"
#include "../src/core/streaming/StreamMultiplexer.hpp"
#include "../src/core/streaming/WatcherRegistry.hpp"
#include "utils/MockComponents.hpp"
#include "utils/TestUtils.hpp"

using namespace Swarmcast;
using namespace Swarmcast::Test;

namespace {

const char* kDirectName = "Movie.2020.1080p.BluRay.x264.mp4";
const char* kTranscodeName = "Show.S01E01.1080p.x265.mkv";

Expected<QByteArray, StreamError> readAll(const std::shared_ptr<ByteSource>& source) {
    QByteArray all;
    while (true) {
        auto chunk = source->read(16 * 1024);
        if (!chunk) {
            return makeUnexpected(chunk.error());
        }
        if (chunk.value().isEmpty()) {
            return all;
        }
        all.append(chunk.value());
    }
}

bool writeBinary(const QString& path, const QByteArray& data) {
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        return false;
    }
    return file.write(data) == data.size();
}

} // namespace

class TestStreamMultiplexer : public QObject {
    Q_OBJECT

private slots:
    void initTestCase() {
        if (!TestUtils::isShellAvailable()) {
            QSKIP("/bin/sh is required to stand in for the transcoder");
        }
        tempDir_ = TestUtils::createTempDirectory("multiplexer");
        const QByteArray stream = buildFragmentedMp4(1);
        const int firstFragment = stream.indexOf("moof") - 4;
        QVERIFY(writeBinary(tempDir_ + "/init.mp4", stream.left(firstFragment)));
        QVERIFY(writeBinary(tempDir_ + "/fragment.mp4", stream.mid(firstFragment)));
    }

    void cleanupTestCase() {
        TestUtils::cleanupTempDirectory(tempDir_);
    }

    void init() {
        hash_ = TestUtils::testInfoHash(31);
        directContent_ = TestUtils::generateRandomData(5000);
        transcodeContent_ = buildFragmentedMp4(3);

        client_ = std::make_unique<FakeSwarmClient>();
        client_->addTorrent(hash_, "Multiplexer Test", {
            {QString("pack/") + kDirectName, directContent_},
            {QString("pack/") + kTranscodeName, transcodeContent_},
            {"pack/empty.mp4", QByteArray()}
        });

        settings_ = TestUtils::fastStreamingSettings();
        pool_ = std::make_unique<TranscodePool>(TestUtils::fastTranscodeSettings());
        pool_->setCommandFactory(TestUtils::shellCommandFactory("exec cat"));
        registry_ = std::make_unique<WatcherRegistry>(client_.get(), pool_.get(), settings_);
        multiplexer_ = makeMultiplexer(settings_);
    }

    void cleanup() {
        multiplexer_.reset();
        registry_.reset();
        pool_.reset();
        client_.reset();
    }

    void testCompatibleFileIsServedDirectly() {
        auto opened = multiplexer_->openStream(hash_, 0, QString());
        ASSERT_EXPECTED_VALUE(opened);
        const StreamResponse& response = opened.value();

        QVERIFY(!response.transcoded);
        QVERIFY(response.seekable);
        QVERIFY(!response.range.has_value());
        QCOMPARE(response.mimeType, QString("video/mp4"));
        QCOMPARE(response.fileName, QString(kDirectName));
        QCOMPARE(response.fileSize, 5000LL);
        QCOMPARE(response.contentLength, 5000LL);
        QVERIFY(response.source);

        QCOMPARE(readAll(response.source).value(), directContent_);
        QCOMPARE(pool_->activeCount(), 0);
        QCOMPARE(registry_->streamWatcherCount(), 1);

        multiplexer_->closeStream(response.watcherId);
        QCOMPARE(registry_->streamWatcherCount(), 0);
    }

    void testDirectRangeRequest() {
        auto opened = multiplexer_->openStream(hash_, 0, "bytes=100-199");
        ASSERT_EXPECTED_VALUE(opened);
        const StreamResponse& response = opened.value();

        QVERIFY(response.range.has_value());
        QCOMPARE(response.range->start, 100LL);
        QCOMPARE(response.range->end, 199LL);
        QCOMPARE(response.contentLength, 100LL);
        QCOMPARE(readAll(response.source).value(), directContent_.mid(100, 100));
        QVERIFY(client_->priorities(hash_).contains(qMakePair(100LL, 199LL)));

        auto watcher = registry_->watcher(response.watcherId);
        QVERIFY(watcher.has_value());
        QCOMPARE(watcher->rangeStart, 100LL);
        QCOMPARE(watcher->rangeEnd, 199LL);

        auto suffix = multiplexer_->openStream(hash_, 0, "bytes=-10");
        ASSERT_EXPECTED_VALUE(suffix);
        QCOMPARE(readAll(suffix.value().source).value(), directContent_.right(10));

        multiplexer_->closeStream(response.watcherId);
        multiplexer_->closeStream(suffix.value().watcherId);
    }

    void testUnsatisfiableRangeLeavesNoWatcher() {
        QSignalSpy failed(multiplexer_.get(), &StreamMultiplexer::streamFailed);
        auto opened = multiplexer_->openStream(hash_, 0, "bytes=6000-");
        ASSERT_EXPECTED_ERROR(opened, StreamError::RangeNotSatisfiable);

        QCOMPARE(failed.count(), 1);
        QCOMPARE(registry_->streamWatcherCount(), 0);
        QCOMPARE(registry_->watcherCount(hash_, 0), 0);
        QCOMPARE(multiplexer_->knownFileSize(hash_, 0).value_or(-1), 5000LL);
        QVERIFY(!multiplexer_->knownFileSize(hash_, 9).has_value());
    }

    void testHeadersOnlyOpensNoSource() {
        auto direct = multiplexer_->openStream(hash_, 0, "bytes=0-", StreamMultiplexer::OpenMode::HeadersOnly);
        ASSERT_EXPECTED_VALUE(direct);
        QVERIFY(!direct.value().source);
        QCOMPARE(direct.value().contentLength, 5000LL);

        auto transcoded = multiplexer_->openStream(hash_, 1, QString(), StreamMultiplexer::OpenMode::HeadersOnly);
        ASSERT_EXPECTED_VALUE(transcoded);
        QVERIFY(transcoded.value().transcoded);
        QVERIFY(!transcoded.value().source);
        QCOMPARE(transcoded.value().contentLength, -1LL);
        QCOMPARE(pool_->activeCount(), 0);
        QCOMPARE(client_->readRangeCount(), 0);

        multiplexer_->closeStream(direct.value().watcherId);
        multiplexer_->closeStream(transcoded.value().watcherId);
    }

    void testEmptyFile() {
        auto opened = multiplexer_->openStream(hash_, 2, QString());
        ASSERT_EXPECTED_VALUE(opened);
        QCOMPARE(opened.value().contentLength, 0LL);
        QVERIFY(readAll(opened.value().source).value().isEmpty());
        multiplexer_->closeStream(opened.value().watcherId);
    }

    void testIncompatibleFileIsTranscoded() {
        auto future = QtConcurrent::run([this]() {
            auto opened = multiplexer_->openStream(hash_, 1, "bytes=0-");
            if (!opened) {
                return Expected<QPair<StreamResponse, QByteArray>, StreamError>(makeUnexpected(opened.error()));
            }
            auto body = readAll(opened.value().source);
            if (!body) {
                return Expected<QPair<StreamResponse, QByteArray>, StreamError>(makeUnexpected(body.error()));
            }
            return Expected<QPair<StreamResponse, QByteArray>, StreamError>(qMakePair(opened.value(), body.value()));
        });
        QVERIFY(TestUtils::waitForFuture(future, 10000));

        const auto result = future.result();
        ASSERT_EXPECTED_VALUE(result);
        const StreamResponse& response = result.value().first;
        QVERIFY(response.transcoded);
        QVERIFY(!response.seekable);
        QVERIFY(!response.range.has_value());
        QCOMPARE(response.mimeType, QString("video/mp4"));
        QCOMPARE(response.contentLength, -1LL);
        QCOMPARE(response.profile.mode, TranscodeMode::Full);
        QCOMPARE(result.value().second, transcodeContent_);

        auto watcher = registry_->watcher(response.watcherId);
        QVERIFY(watcher.has_value() && watcher->transcoded);
        multiplexer_->closeStream(response.watcherId);
    }

    void testTranscodedStreamRefusesSeeking() {
        auto opened = multiplexer_->openStream(hash_, 1, "bytes=1000-");
        ASSERT_EXPECTED_ERROR(opened, StreamError::RangeUnsupported);
        QCOMPARE(pool_->activeCount(), 0);
        QCOMPARE(registry_->streamWatcherCount(), 0);
    }

    void testWatchersShareSwarmAndTranscode() {
        const QString script = QString("cat >/dev/null & cat '%1/init.mp4'; "
                                       "while :; do cat '%1/fragment.mp4'; sleep 0.05; done").arg(tempDir_);
        pool_->setCommandFactory(TestUtils::shellCommandFactory(script));

        auto open = [this]() { return multiplexer_->openStream(hash_, 1, QString()); };
        auto first = QtConcurrent::run(open);
        QVERIFY(TestUtils::waitForFuture(first, 10000));
        auto second = QtConcurrent::run(open);
        QVERIFY(TestUtils::waitForFuture(second, 10000));

        const auto a = first.result();
        const auto b = second.result();
        ASSERT_EXPECTED_VALUE(a);
        ASSERT_EXPECTED_VALUE(b);
        QVERIFY(a.value().watcherId != b.value().watcherId);

        QCOMPARE(client_->swarmCreations(hash_), 1);
        QCOMPARE(client_->joinCount(), 1);
        QCOMPARE(client_->readRangeCount(), 1);
        QCOMPARE(pool_->activeCount(), 1);
        QCOMPARE(pool_->stats().sessions.first().subscribers, 2);
        QCOMPARE(registry_->watcherCount(hash_, 1), 2);

        multiplexer_->closeStream(a.value().watcherId);
        multiplexer_->closeStream(b.value().watcherId);
        QTRY_COMPARE_WITH_TIMEOUT(pool_->activeCount(), 0, 5000);
        QTRY_VERIFY_WITH_TIMEOUT(!client_->isJoined(hash_), 5000);
    }

    void testUnknownFileIndex() {
        ASSERT_EXPECTED_ERROR(multiplexer_->openStream(hash_, 7, QString()), StreamError::FileNotFound);
        ASSERT_EXPECTED_ERROR(multiplexer_->openStream(hash_, -1, QString()), StreamError::FileNotFound);
        QCOMPARE(registry_->streamWatcherCount(), 0);
    }

    void testInvalidIdentifier() {
        ASSERT_EXPECTED_ERROR(multiplexer_->openStream("not-a-hash", 0, QString()), StreamError::InvalidIdentifier);
        ASSERT_EXPECTED_ERROR(multiplexer_->openStatusWatcher("magnet:?dn=nothing", 0),
                              StreamError::InvalidIdentifier);
        QCOMPARE(client_->joinCount(), 0);
    }

    void testMetadataTimeout() {
        Config::StreamingSettings settings = settings_;
        settings.metadataTimeoutMs = 300;
        auto multiplexer = makeMultiplexer(settings);
        client_->setMetadataWithheld(hash_, true);

        QElapsedTimer timer;
        timer.start();
        ASSERT_EXPECTED_ERROR(multiplexer->openStream(hash_, 0, QString()), StreamError::SwarmTimeout);
        QVERIFY(timer.elapsed() >= 250);
        QCOMPARE(registry_->streamWatcherCount(), 0);
    }

    void testStalledPiecesTimeOut() {
        Config::StreamingSettings settings = settings_;
        settings.firstByteTimeoutMs = 300;
        auto multiplexer = makeMultiplexer(settings);
        client_->setStallReads(true);

        QElapsedTimer timer;
        timer.start();
        ASSERT_EXPECTED_ERROR(multiplexer->openStream(hash_, 0, QString()), StreamError::SwarmTimeout);
        QVERIFY(timer.elapsed() >= 250);
        QVERIFY(timer.elapsed() < 5000);
        QCOMPARE(registry_->streamWatcherCount(), 0);
    }

    void testCancelEndsMetadataWait() {
        Config::StreamingSettings settings = settings_;
        settings.metadataTimeoutMs = 30000;
        auto multiplexer = makeMultiplexer(settings);
        client_->setMetadataWithheld(hash_, true);

        CancelToken cancel;
        QElapsedTimer timer;
        timer.start();
        auto opened = QtConcurrent::run([&]() {
            return multiplexer->openStream(hash_, 0, QString(), StreamMultiplexer::OpenMode::Body, &cancel);
        });
        QTRY_COMPARE_WITH_TIMEOUT(registry_->streamWatcherCount(), 1, 5000);

        cancel.cancel();
        QVERIFY(TestUtils::waitForFuture(opened, 2000));
        ASSERT_EXPECTED_ERROR(opened.result(), StreamError::Cancelled);
        QVERIFY(timer.elapsed() < 5000);
        QCOMPARE(registry_->streamWatcherCount(), 0);
    }

    void testCancelEndsFirstByteWait() {
        Config::StreamingSettings settings = settings_;
        settings.firstByteTimeoutMs = 30000;
        auto multiplexer = makeMultiplexer(settings);
        client_->setStallReads(true);

        CancelToken cancel;
        auto opened = QtConcurrent::run([&]() {
            return multiplexer->openStream(hash_, 0, QString(), StreamMultiplexer::OpenMode::Body, &cancel);
        });
        QTRY_COMPARE_WITH_TIMEOUT(client_->readRangeCount(), 1, 5000);

        cancel.cancel();
        QVERIFY(TestUtils::waitForFuture(opened, 2000));
        ASSERT_EXPECTED_ERROR(opened.result(), StreamError::Cancelled);
        QCOMPARE(registry_->streamWatcherCount(), 0);
    }

    void testAlreadyCancelledOpenAttachesNothing() {
        CancelToken cancel;
        cancel.cancel();
        ASSERT_EXPECTED_ERROR(multiplexer_->openStream(hash_, 0, QString(), StreamMultiplexer::OpenMode::Body, &cancel),
                              StreamError::Cancelled);
        QCOMPARE(registry_->streamWatcherCount(), 0);
    }

    void testCatalogCodecsDecideTranscoding() {
        JsonCatalogStore catalog;
        const QByteArray json = QString(R"({"torrents": [{"infoHash": "%1", "files": [
            {"index": 0, "videoCodec": "hevc", "audioCodec": "aac"}]}]})").arg(hash_).toUtf8();
        QVERIFY(catalog.loadJson(json).hasValue());
        multiplexer_->setCatalog(&catalog);

        auto opened = multiplexer_->openStream(hash_, 0, QString(), StreamMultiplexer::OpenMode::HeadersOnly);
        ASSERT_EXPECTED_VALUE(opened);
        QVERIFY(opened.value().transcoded);
        QCOMPARE(opened.value().profile.videoCodec, QString("hevc"));
        QCOMPARE(opened.value().profile.evidenceSource(), QString("probe"));
        multiplexer_->closeStream(opened.value().watcherId);
    }

    void testProbeResultIsCached() {
        FakeCodecProbe probe;
        probe.setResult(kDirectName, ProbedCodecs{"h264", "eac3", "mov"});
        multiplexer_->setProbe(&probe, 1024);

        auto first = multiplexer_->openStream(hash_, 0, QString(), StreamMultiplexer::OpenMode::HeadersOnly);
        ASSERT_EXPECTED_VALUE(first);
        QCOMPARE(first.value().profile.mode, TranscodeMode::AudioOnly);
        QCOMPARE(probe.probeCount(), 1);

        auto second = multiplexer_->openStream(hash_, 0, QString(), StreamMultiplexer::OpenMode::HeadersOnly);
        ASSERT_EXPECTED_VALUE(second);
        QCOMPARE(second.value().profile.mode, TranscodeMode::AudioOnly);
        QCOMPARE(probe.probeCount(), 1);

        multiplexer_->closeStream(first.value().watcherId);
        multiplexer_->closeStream(second.value().watcherId);
    }

    void testStatusWatcherIsTracked() {
        ConnectionStatusPublisher publisher(client_.get(), settings_);
        auto multiplexer = std::make_unique<StreamMultiplexer>(client_.get(), registry_.get(), pool_.get(),
                                                               &publisher, settings_);

        auto watcherId = multiplexer->openStatusWatcher(TestUtils::createTestMagnetLink(hash_), 0);
        ASSERT_EXPECTED_VALUE(watcherId);
        QCOMPARE(registry_->streamWatcherCount(), 0);
        QCOMPARE(registry_->watcherCount(hash_, 0), 1);
        QVERIFY(publisher.current(watcherId.value()).has_value());
        QVERIFY(publisher.subscribe(watcherId.value()) != nullptr);

        multiplexer->closeStream(watcherId.value());
        QVERIFY(!publisher.current(watcherId.value()).has_value());
        QCOMPARE(registry_->watcherCount(hash_, 0), 0);
    }

    void testCloseIsIdempotent() {
        QSignalSpy closed(multiplexer_.get(), &StreamMultiplexer::streamClosed);
        auto opened = multiplexer_->openStream(hash_, 0, QString(), StreamMultiplexer::OpenMode::HeadersOnly);
        ASSERT_EXPECTED_VALUE(opened);

        multiplexer_->closeStream(opened.value().watcherId);
        multiplexer_->closeStream(opened.value().watcherId);
        multiplexer_->closeStream(QString());
        QCOMPARE(closed.count(), 1);
    }

private:
    std::unique_ptr<StreamMultiplexer> makeMultiplexer(const Config::StreamingSettings& settings) {
        return std::make_unique<StreamMultiplexer>(client_.get(), registry_.get(), pool_.get(), nullptr, settings);
    }

    QString tempDir_;
    QString hash_;
    QByteArray directContent_;
    QByteArray transcodeContent_;
    Config::StreamingSettings settings_;
    std::unique_ptr<FakeSwarmClient> client_;
    std::unique_ptr<TranscodePool> pool_;
    std::unique_ptr<WatcherRegistry> registry_;
    std::unique_ptr<StreamMultiplexer> multiplexer_;
};

int runTestStreamMultiplexer(int argc, char** argv) {
    TestStreamMultiplexer test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_stream_multiplexer.moc"
