#include <QtTest/QtTest>
#include <QtConcurrent/QtConcurrent>
#include "../src/core/streaming/ByteRange.hpp"
#include "../src/core/common/ByteChannel.hpp"

using namespace Swarmcast;

class TestByteRange : public QObject {
    Q_OBJECT

private slots:
    void testNoHeaderMeansWholeFile() {
        auto range = ByteRange::parse("", 1000);
        QVERIFY(range.hasValue());
        QVERIFY(!range.value().has_value());

        auto garbage = ByteRange::parse("items=0-10", 1000);
        QVERIFY(garbage.hasValue());
        QVERIFY(!garbage.value().has_value());
    }

    void testClosedRange() {
        auto range = ByteRange::parse("bytes=0-499", 1000);
        QVERIFY(range.hasValue() && range.value().has_value());
        QCOMPARE(range.value()->start, 0LL);
        QCOMPARE(range.value()->end, 499LL);
        QCOMPARE(range.value()->length(), 500LL);
        QCOMPARE(range.value()->contentRange(1000), QString("bytes 0-499/1000"));
    }

    void testOpenEndedRange() {
        auto range = ByteRange::parse("bytes=500-", 1000);
        QVERIFY(range.hasValue() && range.value().has_value());
        QCOMPARE(range.value()->start, 500LL);
        QCOMPARE(range.value()->end, 999LL);

        auto whole = ByteRange::parse("bytes=0-", 1000);
        QVERIFY(whole.value()->coversWhole(1000));
    }

    void testSuffixRange() {
        auto range = ByteRange::parse("bytes=-100", 1000);
        QVERIFY(range.hasValue() && range.value().has_value());
        QCOMPARE(range.value()->start, 900LL);
        QCOMPARE(range.value()->end, 999LL);

        auto larger = ByteRange::parse("bytes=-5000", 1000);
        QCOMPARE(larger.value()->start, 0LL);
    }

    void testOnlyFirstRangeIsServed() {
        auto range = ByteRange::parse("bytes=10-19, 30-39", 1000);
        QVERIFY(range.hasValue() && range.value().has_value());
        QCOMPARE(range.value()->start, 10LL);
        QCOMPARE(range.value()->end, 19LL);
    }

    void testUnsatisfiableRanges() {
        QCOMPARE(ByteRange::parse("bytes=1000-", 1000).error(), StreamError::RangeNotSatisfiable);
        QCOMPARE(ByteRange::parse("bytes=0-1000", 1000).error(), StreamError::RangeNotSatisfiable);
        QCOMPARE(ByteRange::parse("bytes=600-500", 1000).error(), StreamError::RangeNotSatisfiable);
        QCOMPARE(ByteRange::parse("bytes=-0", 1000).error(), StreamError::RangeNotSatisfiable);
        QCOMPARE(ByteRange::parse("bytes=0-", 0).error(), StreamError::RangeNotSatisfiable);
    }

    void testIsFromStart() {
        QVERIFY(ByteRange::isFromStart("bytes=0-"));
        QVERIFY(ByteRange::isFromStart("bytes=0-1023"));
        QVERIFY(!ByteRange::isFromStart("bytes=1024-"));
        QVERIFY(!ByteRange::isFromStart("bytes=-500"));
    }

    void testByteChannelDeliversInOrderThenEnds() {
        ByteChannel channel(1024);
        QVERIFY(channel.push("hello "));
        QVERIFY(channel.push("world"));
        channel.finish();

        QCOMPARE(channel.read(4).value(), QByteArray("hell"));
        QCOMPARE(channel.read(100).value(), QByteArray("o "));
        QCOMPARE(channel.read(100).value(), QByteArray("world"));
        QVERIFY(channel.read(100).value().isEmpty());
        QVERIFY(!channel.push("late"));
    }

    void testByteChannelOverflowFailsReader() {
        ByteChannel channel(8);
        QVERIFY(channel.push("1234"));
        QVERIFY(!channel.push("56789"));

        auto read = channel.read(16);
        QVERIFY(read.hasError());
        QCOMPARE(read.error(), StreamError::BufferOverflow);
    }

    void testByteChannelStallTimesOut() {
        ByteChannel channel(1024, 50);
        auto read = channel.read(16);
        QVERIFY(read.hasError());
        QCOMPARE(read.error(), StreamError::SwarmTimeout);
    }

    void testByteChannelCancelWakesReader() {
        auto channel = std::make_shared<ByteChannel>(1024);
        QTimer::singleShot(50, [channel]() { channel->cancel(); });

        auto future = QtConcurrent::run([channel]() { return channel->read(16); });
        QTRY_VERIFY_WITH_TIMEOUT(future.isFinished(), 5000);
        QCOMPARE(future.result().error(), StreamError::Cancelled);
    }
};

int runTestByteRange(int argc, char** argv) {
    TestByteRange test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_byte_range.moc"
