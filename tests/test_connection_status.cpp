#include <QtTest/QtTest>
#include "../src/core/streaming/ConnectionStatus.hpp"
#include "../src/core/torrent/MagnetUri.hpp"
#include "utils/MockComponents.hpp"
#include "utils/TestUtils.hpp"

using namespace Swarmcast;
using namespace Swarmcast::Test;

namespace {

ConnectionStatus statusAt(ConnectionStage stage) {
    ConnectionStatus status;
    status.stage = stage;
    return status;
}

SwarmStats statsWith(bool hasMetadata, int peers, qint64 fileBytesDone = 0) {
    SwarmStats stats;
    stats.hasMetadata = hasMetadata;
    stats.numPeers = peers;
    stats.fileBytesDone = {fileBytesDone};
    return stats;
}

} // namespace

class TestConnectionStatus : public QObject {
    Q_OBJECT

private slots:
    void testStagesOnlyMoveForward() {
        auto channel = std::make_shared<StatusChannel>("w1");
        QVERIFY(channel->publish(statusAt(ConnectionStage::Connecting)));
        QVERIFY(channel->publish(statusAt(ConnectionStage::DownloadingMetadata)));
        QVERIFY(!channel->publish(statusAt(ConnectionStage::SearchingPeers)));
        QCOMPARE(channel->current()->stage, ConnectionStage::DownloadingMetadata);

        // Same stage with new figures is accepted
        ConnectionStatus more = statusAt(ConnectionStage::DownloadingMetadata);
        more.numPeers = 4;
        QVERIFY(channel->publish(more));
        QCOMPARE(channel->current()->numPeers, 4);
    }

    void testErrorFromAnyStageThenNothing() {
        auto channel = std::make_shared<StatusChannel>("w1");
        QVERIFY(channel->publish(statusAt(ConnectionStage::Buffering)));
        QVERIFY(channel->publish(statusAt(ConnectionStage::Error)));
        QVERIFY(!channel->publish(statusAt(ConnectionStage::Ready)));
        QVERIFY(!channel->publish(statusAt(ConnectionStage::Error)));
        QCOMPARE(channel->current()->stage, ConnectionStage::Error);
    }

    void testNothingAfterReady() {
        auto channel = std::make_shared<StatusChannel>("w1");
        QVERIFY(channel->publish(statusAt(ConnectionStage::Ready)));
        QVERIFY(!channel->publish(statusAt(ConnectionStage::Error)));

        channel->close();
        QVERIFY(channel->isClosed());
        QVERIFY(!channel->publish(statusAt(ConnectionStage::Ready)));
    }

    void testReaderStartsWithCurrentAndEndsAfterTerminal() {
        auto channel = std::make_shared<StatusChannel>("w1");
        channel->publish(statusAt(ConnectionStage::SearchingPeers));

        auto reader = channel->subscribe();
        StatusReader::Read read = reader->next(0);
        QCOMPARE(read.result, StatusReader::Result::Event);
        QCOMPARE(read.status.stage, ConnectionStage::SearchingPeers);
        QCOMPARE(reader->next(20).result, StatusReader::Result::Timeout);

        channel->publish(statusAt(ConnectionStage::Buffering));
        channel->publish(statusAt(ConnectionStage::Ready));
        QCOMPARE(reader->next(0).status.stage, ConnectionStage::Buffering);
        QCOMPARE(reader->next(0).status.stage, ConnectionStage::Ready);
        QCOMPARE(reader->next(1000).result, StatusReader::Result::Ended);
    }

    void testReaderWakesOnPublishAndClose() {
        auto channel = std::make_shared<StatusChannel>("w1");
        auto reader = channel->subscribe();

        auto waiting = QtConcurrent::run([reader]() { return reader->next(5000); });
        QTest::qWait(50);
        channel->publish(statusAt(ConnectionStage::Connecting));
        QVERIFY(TestUtils::waitForFuture(waiting, 5000));
        QCOMPARE(waiting.result().result, StatusReader::Result::Event);
        QCOMPARE(waiting.result().status.stage, ConnectionStage::Connecting);

        auto ending = QtConcurrent::run([reader]() { return reader->next(5000); });
        QTest::qWait(50);
        channel->close();
        QVERIFY(TestUtils::waitForFuture(ending, 5000));
        QCOMPARE(ending.result().result, StatusReader::Result::Ended);
    }

    void testDeriveStages() {
        const Config::StreamingSettings settings = TestUtils::fastStreamingSettings();
        const DhtStatus dhtReady{true, 150};
        const DhtStatus dhtCold{false, 0};

        QCOMPARE(ConnectionStatusPublisher::derive(std::nullopt, dhtReady, 0, -1, MediaKind::Video, settings).stage,
                 ConnectionStage::Initializing);
        QCOMPARE(ConnectionStatusPublisher::derive(statsWith(false, 0), dhtCold, 0, -1, MediaKind::Video, settings).stage,
                 ConnectionStage::Connecting);
        QCOMPARE(ConnectionStatusPublisher::derive(statsWith(false, 0), dhtReady, 0, -1, MediaKind::Video, settings).stage,
                 ConnectionStage::SearchingPeers);
        QCOMPARE(ConnectionStatusPublisher::derive(statsWith(false, 2), dhtReady, 0, -1, MediaKind::Video, settings).stage,
                 ConnectionStage::DownloadingMetadata);

        const ConnectionStatus buffering =
            ConnectionStatusPublisher::derive(statsWith(true, 5, 512), dhtReady, 0, 4096, MediaKind::Video, settings);
        QCOMPARE(buffering.stage, ConnectionStage::Buffering);
        QVERIFY(!buffering.fileReady);
        QCOMPARE(buffering.fileProgress, 0.125);
        QCOMPARE(buffering.numPeers, 5);

        const ConnectionStatus ready =
            ConnectionStatusPublisher::derive(statsWith(true, 5, 1024), dhtReady, 0, 4096, MediaKind::Video, settings);
        QCOMPARE(ready.stage, ConnectionStage::Ready);
        QVERIFY(ready.fileReady);
        QVERIFY(ready.toJson().value("ready").toBool());
        QCOMPARE(ready.toJson().value("stage").toString(), QString("ready"));
    }

    void testFileReadiness() {
        const Config::StreamingSettings settings = TestUtils::fastStreamingSettings();
        QVERIFY(ConnectionStatusPublisher::isFileReady(256, 100000, MediaKind::Audio, settings));
        QVERIFY(!ConnectionStatusPublisher::isFileReady(256, 100000, MediaKind::Video, settings));
        QVERIFY(ConnectionStatusPublisher::isFileReady(100, 100, MediaKind::Video, settings));
        QVERIFY(!ConnectionStatusPublisher::isFileReady(5000, -1, MediaKind::Video, settings));
    }

    void testStatusJson() {
        ConnectionStatus status = statusAt(ConnectionStage::SearchingPeers);
        status.message = "Searching for peers...";
        const QJsonObject json = status.toJson();
        QCOMPARE(json.value("stage").toString(), QString("searching_peers"));
        QVERIFY(!json.value("ready").toBool());
        QVERIFY(!json.contains("fileProgress"));
        QVERIFY(!json.contains("fileIndex"));

        status.fileIndex = 2;
        status.fileProgress = 0.5;
        QCOMPARE(status.toJson().value("fileIndex").toInt(), 2);
        QCOMPARE(status.toJson().value("fileProgress").toDouble(), 0.5);
        QVERIFY(isTerminalStage(ConnectionStage::Error));
        QVERIFY(!isTerminalStage(ConnectionStage::Buffering));
    }

    void testPublisherFollowsSwarm() {
        FakeSwarmClient client;
        const QString hash = TestUtils::testInfoHash(41);
        client.addTorrent(hash, "Status Test", {{"movie.mp4", QByteArray(4096, 'm')}});
        auto handle = client.join(MagnetUri::fromIdentifier(hash).value());
        QVERIFY(handle.hasValue());

        ConnectionStatusPublisher publisher(&client, TestUtils::fastStreamingSettings());
        client.setStats(hash, statsWith(false, 0));
        publisher.track("watcher", handle.value(), 0);
        QCOMPARE(publisher.current("watcher")->stage, ConnectionStage::SearchingPeers);

        auto reader = publisher.subscribe("watcher");
        QVERIFY(reader);
        QVERIFY(!publisher.subscribe("unknown"));
        QCOMPARE(reader->next(0).status.stage, ConnectionStage::SearchingPeers);

        client.setStats(hash, statsWith(false, 3));
        publisher.poll();
        QCOMPARE(reader->next(0).status.stage, ConnectionStage::DownloadingMetadata);

        // Peer count dropping to zero must not move the stage back
        client.setStats(hash, statsWith(false, 0));
        publisher.poll();
        QCOMPARE(reader->next(0).result, StatusReader::Result::Timeout);
        QCOMPARE(publisher.current("watcher")->stage, ConnectionStage::DownloadingMetadata);

        client.setStats(hash, statsWith(true, 3, 100));
        publisher.poll();
        const StatusReader::Read buffering = reader->next(0);
        QCOMPARE(buffering.status.stage, ConnectionStage::Buffering);
        QVERIFY(buffering.status.fileProgress > 0.0);

        client.setStats(hash, statsWith(true, 3, 2048));
        publisher.poll();
        QCOMPARE(reader->next(0).status.stage, ConnectionStage::Ready);
        QCOMPARE(reader->next(100).result, StatusReader::Result::Ended);
    }

    void testPublisherReportsErrors() {
        FakeSwarmClient client;
        const QString hash = TestUtils::testInfoHash(42);
        auto handle = client.join(MagnetUri::fromIdentifier(hash).value());
        QVERIFY(handle.hasValue());

        ConnectionStatusPublisher publisher(&client, TestUtils::fastStreamingSettings());
        client.setStats(hash, statsWith(false, 1));
        publisher.track("watcher", handle.value(), 0);
        auto reader = publisher.subscribe("watcher");
        QCOMPARE(reader->next(0).status.stage, ConnectionStage::DownloadingMetadata);

        publisher.publishError("watcher", StreamError::SwarmTimeout);
        const StatusReader::Read failed = reader->next(0);
        QCOMPARE(failed.status.stage, ConnectionStage::Error);
        QVERIFY(failed.status.message.startsWith("Connection error"));
        QCOMPARE(failed.status.numPeers, 1);

        publisher.untrack("watcher");
        QVERIFY(!publisher.current("watcher").has_value());
        QCOMPARE(reader->next(100).result, StatusReader::Result::Ended);
    }

    void testTimerPublishesWithoutPolling() {
        FakeSwarmClient client;
        const QString hash = TestUtils::testInfoHash(43);
        auto handle = client.join(MagnetUri::fromIdentifier(hash).value());
        ConnectionStatusPublisher publisher(&client, TestUtils::fastStreamingSettings());
        client.setStats(hash, statsWith(false, 0));
        publisher.track("watcher", handle.value(), 0);

        client.setStats(hash, statsWith(false, 2));
        QTRY_COMPARE_WITH_TIMEOUT(publisher.current("watcher")->stage, ConnectionStage::DownloadingMetadata, 2000);
    }
};

int runTestConnectionStatus(int argc, char** argv) {
    TestConnectionStatus test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_connection_status.moc"
