#include <QtTest/QtTest>
#include "../src/core/torrent/MagnetUri.hpp"
#include "../src/core/security/InfoHashValidator.hpp"

using namespace Swarmcast;

namespace {
const QString kHash = "c9e15763f722f23e98a29decdfae341b98d53056";
const QString kHashBase32 = "ZHQVOY7XELZD5GFCTXWN7LRUDOMNKMCW";
}

class TestMagnetUri : public QObject {
    Q_OBJECT

private slots:
    void testParseFullLink() {
        const QString link = QString("magnet:?xt=urn:btih:%1&dn=Big+Buck%20Bunny&xl=276134947"
                                     "&tr=udp%3A%2F%2Ftracker.example.org%3A1337&ws=https%3A%2F%2Fseed.example.org%2F")
                                 .arg(kHash);
        auto magnet = MagnetUri::parse(link);

        QVERIFY(magnet.hasValue());
        QCOMPARE(magnet.value().infoHash, kHash);
        QCOMPARE(magnet.value().displayName, QString("Big Buck Bunny"));
        QCOMPARE(magnet.value().exactLength, 276134947LL);
        QCOMPARE(magnet.value().trackers, QStringList{"udp://tracker.example.org:1337"});
        QCOMPARE(magnet.value().webSeeds, QStringList{"https://seed.example.org/"});
    }

    void testHashIsCanonicalized() {
        auto upper = MagnetUri::parse("magnet:?xt=urn:btih:" + kHash.toUpper());
        QVERIFY(upper.hasValue());
        QCOMPARE(upper.value().infoHash, kHash);

        auto base32 = MagnetUri::parse("magnet:?xt=urn:btih:" + kHashBase32);
        QVERIFY(base32.hasValue());
        QCOMPARE(base32.value().infoHash, kHash);
    }

    void testIndexedTrackerKeys() {
        auto magnet = MagnetUri::parse(QString("magnet:?xt=urn:btih:%1&tr.1=udp://a:1&tr.2=udp://b:2").arg(kHash));
        QVERIFY(magnet.hasValue());
        QCOMPARE(magnet.value().trackers.size(), 2);
    }

    void testRejectsMalformedLinks() {
        QCOMPARE(MagnetUri::parse("").error(), StreamError::InvalidIdentifier);
        QCOMPARE(MagnetUri::parse("http://example.org/file.torrent").error(), StreamError::InvalidIdentifier);
        QCOMPARE(MagnetUri::parse("magnet:?dn=NoTopic").error(), StreamError::InvalidIdentifier);
        QCOMPARE(MagnetUri::parse("magnet:?xt=urn:btih:" + kHash.left(39)).error(), StreamError::InvalidIdentifier);
        QCOMPARE(MagnetUri::parse("magnet:?xt=urn:btih:" + QString(40, 'z')).error(), StreamError::InvalidIdentifier);
        QCOMPARE(MagnetUri::parse("magnet:?xt=urn:sha1:" + kHash).error(), StreamError::InvalidIdentifier);

        const QString huge = "magnet:?xt=urn:btih:" + kHash + "&dn=" + QString(MagnetUri::MAX_URI_LENGTH, 'a');
        QCOMPARE(MagnetUri::parse(huge).error(), StreamError::InvalidIdentifier);
    }

    void testFromIdentifier() {
        auto bare = MagnetUri::fromIdentifier("  " + kHash.toUpper() + " ");
        QVERIFY(bare.hasValue());
        QCOMPARE(bare.value().infoHash, kHash);
        QVERIFY(bare.value().trackers.isEmpty());

        auto fromBase32 = MagnetUri::fromIdentifier(kHashBase32);
        QVERIFY(fromBase32.hasValue());
        QCOMPARE(fromBase32.value().infoHash, kHash);

        auto link = MagnetUri::fromIdentifier("magnet:?xt=urn:btih:" + kHash + "&dn=x");
        QVERIFY(link.hasValue());
        QCOMPARE(link.value().displayName, QString("x"));

        QCOMPARE(MagnetUri::fromIdentifier("not-a-hash").error(), StreamError::InvalidIdentifier);
    }

    void testToStringDropsDuplicateTrackers() {
        auto magnet = MagnetUri::parse(QString("magnet:?xt=urn:btih:%1&dn=My+Movie&tr=udp://a:1&tr=UDP://A:1&tr=udp://b:2")
                                           .arg(kHash));
        QVERIFY(magnet.hasValue());
        QCOMPARE(magnet.value().trackers.size(), 3);

        const QString text = magnet.value().toString();
        QVERIFY(text.startsWith("magnet:?xt=urn:btih:" + kHash));
        QCOMPARE(text.count("&tr="), 2);

        auto reparsed = MagnetUri::parse(text);
        QVERIFY(reparsed.hasValue());
        QCOMPARE(reparsed.value().infoHash, kHash);
        QCOMPARE(reparsed.value().displayName, QString("My Movie"));
    }

    void testWithTrackersPutsPreferredFirst() {
        MagnetUri magnet;
        magnet.infoHash = kHash;
        magnet.trackers = {"udp://original:1", "udp://shared:2"};

        const MagnetUri enhanced = magnet.withTrackers({"udp://shared:2", "udp://preferred:3"});
        QCOMPARE(enhanced.trackers,
                 QStringList({"udp://shared:2", "udp://preferred:3", "udp://original:1"}));
    }

    void testDisplayNameFallback() {
        MagnetUri magnet;
        magnet.infoHash = kHash;
        QCOMPARE(magnet.displayNameOr(), QString("Torrent c9e15763"));

        magnet.displayName = "From Link";
        QCOMPARE(magnet.displayNameOr(), QString("From Link"));
        QCOMPARE(magnet.displayNameOr("From Metadata"), QString("From Metadata"));
    }

    void testInfoHashValidator() {
        QVERIFY(InfoHashValidator::isValid(kHash));
        QVERIFY(!InfoHashValidator::isValid(kHash + "0"));
        QVERIFY(InfoHashValidator::isValidBase32(kHashBase32));
        QCOMPARE(InfoHashValidator::fromBase32(kHashBase32), kHash);
        QVERIFY(InfoHashValidator::normalize("xyz").isEmpty());
        QCOMPARE(InfoHashValidator::generateTestHash(7), InfoHashValidator::generateTestHash(7));
    }
};

int runTestMagnetUri(int argc, char** argv) {
    TestMagnetUri test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_magnet_uri.moc"
