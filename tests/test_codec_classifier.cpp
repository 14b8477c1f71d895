#include <QtTest/QtTest>
#include "../src/core/media/CodecClassifier.hpp"
#include "../src/core/media/TranscodePlan.hpp"
#include "utils/TestUtils.hpp"

using namespace Swarmcast;
using namespace Swarmcast::Test;

class TestCodecClassifier : public QObject {
    Q_OBJECT

private slots:
    void testReleaseNameTags_data() {
        QTest::addColumn<QString>("fileName");
        QTest::addColumn<QString>("videoCodec");
        QTest::addColumn<QString>("audioCodec");
        QTest::addColumn<bool>("needsTranscoding");
        QTest::addColumn<QString>("mode");

        QTest::newRow("ddp5.1 with h264") << "Movie.2023.1080p.WEB-DL.DDP5.1.H.264-GROUP.mkv"
                                          << "h264" << "eac3" << true << "audio_only";
        QTest::newRow("atmos") << "Movie.2160p.WEB-DL.DDP5.1.Atmos.H.264.mkv"
                               << "h264" << "eac3" << true << "audio_only";
        QTest::newRow("x265") << "Show.S01E01.1080p.x265-GRP.mkv" << "hevc" << "" << true << "full";
        QTest::newRow("xvid avi") << "Old.Movie.XviD.avi" << "mpeg4" << "" << true << "full";
        QTest::newRow("truehd") << "Film.1080p.BluRay.TrueHD.7.1.x264.mkv" << "h264" << "truehd" << true << "audio_only";
        QTest::newRow("dts") << "Film.720p.DTS.x264.mp4" << "h264" << "dts" << true << "audio_only";
        QTest::newRow("plain x264 mp4") << "Movie.2020.1080p.BluRay.x264.mp4" << "h264" << "" << false << "none";
        QTest::newRow("flac album") << "Artist - Track.FLAC.flac" << "" << "flac" << false << "none";
    }

    void testReleaseNameTags() {
        QFETCH(QString, fileName);
        QFETCH(QString, videoCodec);
        QFETCH(QString, audioCodec);
        QFETCH(bool, needsTranscoding);
        QFETCH(QString, mode);

        const CodecProfile profile = CodecClassifier::classify(fileName);
        QCOMPARE(profile.videoCodec, videoCodec);
        QCOMPARE(profile.audioCodec, audioCodec);
        QCOMPARE(profile.needsTranscoding, needsTranscoding);
        QCOMPARE(transcodeModeName(profile.mode), mode);
        QCOMPARE(profile.evidenceSource(), QString("filename"));
    }

    void testEac3IsLabelled() {
        const CodecProfile profile = CodecClassifier::classify("Movie.2023.DDP5.1.H.264.mkv");
        QVERIFY(profile.matchedLabels.contains("audio:eac3"));
        QCOMPARE(profile.container, QString("mkv"));
        QCOMPARE(profile.mediaKind, MediaKind::Video);
    }

    void testProbedCodecsWinOverFilename() {
        ProbedCodecs probed{"H264", "AAC", "matroska"};
        const CodecProfile profile = CodecClassifier::classify("Movie.DDP5.1.x265.mkv", probed);

        QCOMPARE(profile.videoCodec, QString("h264"));
        QCOMPARE(profile.audioCodec, QString("aac"));
        QVERIFY(!profile.needsTranscoding);
        QCOMPARE(profile.evidenceSource(), QString("probe"));
    }

    void testEmptyProbeFallsBackToFilename() {
        const CodecProfile profile = CodecClassifier::classify("Movie.x265.mkv", ProbedCodecs{});
        QCOMPARE(profile.videoCodec, QString("hevc"));
        QCOMPARE(profile.evidenceSource(), QString("filename"));
    }

    void testNoEvidenceAssumesCompatible() {
        const CodecProfile profile = CodecClassifier::classify("holiday.mp4");
        QVERIFY(!profile.needsTranscoding);
        QCOMPARE(profile.mode, TranscodeMode::None);
        QCOMPARE(profile.evidenceSource(), QString("none"));
        QVERIFY(profile.matchedLabels.isEmpty());
    }

    void testLegacyContainersNeedRemux() {
        const CodecProfile video = CodecClassifier::classify("clip.avi");
        QCOMPARE(video.mode, TranscodeMode::Remux);
        QVERIFY(video.needsTranscoding);
        QVERIFY(video.matchedLabels.contains("container:avi"));

        // Audio containers cannot be stream-copied into MP4
        const CodecProfile audio = CodecClassifier::classify("song.wma");
        QCOMPARE(audio.mediaKind, MediaKind::Audio);
        QCOMPARE(audio.mode, TranscodeMode::AudioOnly);
    }

    void testNonMediaFiles() {
        const CodecProfile profile = CodecClassifier::classify("Movie/readme.nfo");
        QCOMPARE(profile.mediaKind, MediaKind::Other);
        QVERIFY(!profile.needsTranscoding);
        QCOMPARE(CodecClassifier::mimeTypeFor("readme.nfo"), QString("application/octet-stream"));
    }

    void testClassificationIsPure() {
        const QString name = "Series.S02E03.1080p.WEB.DDP5.1.x265.mkv";
        const CodecProfile first = CodecClassifier::classify(name);
        const CodecProfile second = CodecClassifier::classify(name);

        QCOMPARE(first.videoCodec, second.videoCodec);
        QCOMPARE(first.audioCodec, second.audioCodec);
        QCOMPARE(first.mode, second.mode);
        QCOMPARE(first.matchedLabels, second.matchedLabels);
        QCOMPARE(first.needsTranscoding, second.needsTranscoding);
        QCOMPARE(first.container, second.container);
        QCOMPARE(first.evidenceSource(), second.evidenceSource());
        QVERIFY(first.computedAt.isNull());
        QVERIFY(second.computedAt.isNull());
    }

    void testMimeTypes() {
        QCOMPARE(CodecClassifier::mimeTypeFor("a.MP4"), QString("video/mp4"));
        QCOMPARE(CodecClassifier::mimeTypeFor("dir/a.mkv"), QString("video/x-matroska"));
        QCOMPARE(CodecClassifier::mimeTypeFor("a.webm"), QString("video/webm"));
        QCOMPARE(CodecClassifier::mimeTypeFor("a.mp3"), QString("audio/mpeg"));
        QCOMPARE(CodecClassifier::transcodedMimeType(MediaKind::Audio), QString("audio/mp4"));
        QCOMPARE(CodecClassifier::transcodedMimeType(MediaKind::Video), QString("video/mp4"));
    }

    void testProfileCache() {
        CodecProfileCache cache;
        const QString hash = TestUtils::testInfoHash(1);

        const CodecProfile first = cache.insert(hash, 0, CodecClassifier::classify("a.x265.mkv"));
        const CodecProfile second = cache.insert(hash, 0, CodecClassifier::classify("a.mp4"));
        QCOMPARE(first.videoCodec, QString("hevc"));
        QCOMPARE(second.videoCodec, QString("hevc"));
        QVERIFY(first.computedAt.isValid());
        QCOMPARE(second.computedAt, first.computedAt);
        QCOMPARE(cache.find(hash, 0)->computedAt, first.computedAt);

        cache.insert(hash, 1, CodecClassifier::classify("b.mp4"));
        cache.insert(TestUtils::testInfoHash(2), 0, CodecClassifier::classify("c.mp4"));
        QCOMPARE(cache.size(), 3);
        QVERIFY(cache.find(hash, 1).has_value());

        cache.removeSwarm(hash);
        QCOMPARE(cache.size(), 1);
        QVERIFY(!cache.find(hash, 0).has_value());
        QCOMPARE(CodecProfileCache::key(hash, 4), hash + ":4");
    }

    void testTranscodePlanArguments() {
        Config::TranscodeSettings settings;

        const TranscodePlan audioOnly = TranscodePlan::fromProfile(
            CodecClassifier::classify("Movie.DDP5.1.H.264.mkv"));
        const QStringList copyArgs = audioOnly.arguments(settings);
        QVERIFY(copyArgs.contains("pipe:0"));
        QVERIFY(copyArgs.contains("pipe:1"));
        QCOMPARE(copyArgs.at(copyArgs.indexOf("-c:v") + 1), QString("copy"));
        QCOMPARE(copyArgs.at(copyArgs.indexOf("-c:a") + 1), QString("aac"));
        QVERIFY(copyArgs.join(' ').contains("frag_keyframe"));

        const TranscodePlan full = TranscodePlan::fromProfile(CodecClassifier::classify("Show.x265.mkv"));
        const QStringList fullArgs = full.arguments(settings);
        QCOMPARE(fullArgs.at(fullArgs.indexOf("-c:v") + 1), QString("libx264"));
        QCOMPARE(full.outputMimeType(), QString("video/mp4"));
    }
};

int runTestCodecClassifier(int argc, char** argv) {
    TestCodecClassifier test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_codec_classifier.moc"
