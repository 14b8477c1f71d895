#include "CodecClassifier.hpp"

#include <QtCore/QFileInfo>
#include <QtCore/QRegularExpression>
#include <QtCore/QSet>

namespace Swarmcast {

namespace {

struct CodecPattern {
    QRegularExpression pattern;
    QString codec;
};

CodecPattern makePattern(const char* regex, const char* codec) {
    return CodecPattern{
        QRegularExpression(QString::fromLatin1(regex), QRegularExpression::CaseInsensitiveOption),
        QString::fromLatin1(codec)};
}

const QSet<QString>& incompatibleVideoCodecs() {
    static const QSet<QString> codecs = {
        "hevc", "h265", "x265",
        "mpeg2video", "mpeg1video",
        "mpeg4", "msmpeg4v2", "msmpeg4v3", "divx", "xvid",
        "wmv1", "wmv2", "wmv3", "vc1",
        "rv30", "rv40",
        "h263", "flv1"
    };
    return codecs;
}

const QSet<QString>& incompatibleAudioCodecs() {
    static const QSet<QString> codecs = {
        "eac3", "ec-3", "ac3", "ac-3",
        "truehd", "mlp",
        "dts", "dca", "dts-hd", "dtshd",
        "pcm_s24le", "pcm_s32le", "pcm_f64le",
        "cook", "sipr", "atrac3", "atrac3p",
        "wmav1", "wmav2", "wmavoice", "wmapro"
    };
    return codecs;
}

// Ordered most specific first
const QList<CodecPattern>& audioPatterns() {
    static const QList<CodecPattern> patterns = {
        makePattern(R"(\bDDP?\d?\.\d\.?Atmos\b)", "eac3"),
        makePattern(R"(\bDD[P+]\d?\.\d\b)", "eac3"),
        makePattern(R"(\bEAC-?3\b)", "eac3"),
        makePattern(R"(\bE-AC-3\b)", "eac3"),
        makePattern(R"(\bAtmos\b)", "eac3"),
        makePattern(R"(\bTrueHD\b)", "truehd"),
        makePattern(R"(\bDTS[-.]?HD\b)", "dts"),
        makePattern(R"(\bDTS[-.]?MA\b)", "dts"),
        makePattern(R"(\bDTS[-.]?X\b)", "dts"),
        makePattern(R"(\bDTS\b)", "dts"),
        makePattern(R"(\bAC-?3\b)", "ac3"),
        makePattern(R"(\bDD\d\.\d\b)", "ac3"),
        makePattern(R"(\bFLAC\b)", "flac"),
        makePattern(R"(\bPCM\b)", "pcm_s24le"),
        makePattern(R"(\bWMA\b)", "wmav2"),
    };
    return patterns;
}

const QList<CodecPattern>& videoPatterns() {
    static const QList<CodecPattern> patterns = {
        makePattern(R"(\b(x265|HEVC|H\.?265)\b)", "hevc"),
        makePattern(R"(\bXviD\b)", "mpeg4"),
        makePattern(R"(\bDivX\b)", "mpeg4"),
        makePattern(R"(\bVC-?1\b)", "vc1"),
        makePattern(R"(\bMPEG-?2\b)", "mpeg2video"),
        makePattern(R"(\b(x264|H\.?264|AVC)\b)", "h264"),
    };
    return patterns;
}

const QSet<QString>& remuxContainers() {
    static const QSet<QString> extensions = {
        "avi", "wmv", "asf", "flv", "ts", "m2ts", "mts", "mpg", "mpeg",
        "vob", "rm", "rmvb", "3gp", "wma", "aiff", "aif", "ape"
    };
    return extensions;
}

const QHash<QString, QString>& mimeTypes() {
    static const QHash<QString, QString> types = {
        {"mp4", "video/mp4"}, {"m4v", "video/mp4"}, {"webm", "video/webm"},
        {"mkv", "video/x-matroska"}, {"avi", "video/x-msvideo"}, {"mov", "video/quicktime"},
        {"wmv", "video/x-ms-wmv"}, {"asf", "video/x-ms-asf"}, {"flv", "video/x-flv"},
        {"ts", "video/mp2t"}, {"m2ts", "video/mp2t"}, {"mts", "video/mp2t"},
        {"mpg", "video/mpeg"}, {"mpeg", "video/mpeg"}, {"vob", "video/mpeg"},
        {"ogv", "video/ogg"}, {"3gp", "video/3gpp"},
        {"rm", "application/vnd.rn-realmedia"}, {"rmvb", "application/vnd.rn-realmedia-vbr"},
        {"mp3", "audio/mpeg"}, {"m4a", "audio/mp4"}, {"aac", "audio/aac"},
        {"flac", "audio/flac"}, {"wav", "audio/wav"}, {"ogg", "audio/ogg"},
        {"opus", "audio/opus"}, {"wma", "audio/x-ms-wma"},
        {"aiff", "audio/aiff"}, {"aif", "audio/aiff"}, {"ape", "audio/x-ape"}
    };
    return types;
}

const QSet<QString>& videoExtensions() {
    static const QSet<QString> extensions = {
        "mp4", "m4v", "mkv", "webm", "avi", "mov", "wmv", "asf", "flv",
        "ts", "m2ts", "mts", "mpg", "mpeg", "vob", "ogv", "3gp", "rm", "rmvb", "divx"
    };
    return extensions;
}

const QSet<QString>& audioExtensions() {
    static const QSet<QString> extensions = {
        "mp3", "m4a", "aac", "flac", "wav", "ogg", "opus", "wma",
        "aiff", "aif", "ape", "alac"
    };
    return extensions;
}

} // namespace

QString CodecProfile::evidenceSource() const {
    if (std::holds_alternative<ProbedCodecs>(evidence)) {
        return QStringLiteral("probe");
    }
    if (std::holds_alternative<FilenameInference>(evidence)) {
        return QStringLiteral("filename");
    }
    return QStringLiteral("none");
}

QString transcodeModeName(TranscodeMode mode) {
    switch (mode) {
        case TranscodeMode::None:      return QStringLiteral("none");
        case TranscodeMode::Remux:     return QStringLiteral("remux");
        case TranscodeMode::AudioOnly: return QStringLiteral("audio_only");
        case TranscodeMode::Full:      return QStringLiteral("full");
    }
    return QStringLiteral("none");
}

QString mediaKindName(MediaKind kind) {
    switch (kind) {
        case MediaKind::Video: return QStringLiteral("video");
        case MediaKind::Audio: return QStringLiteral("audio");
        case MediaKind::Other: return QStringLiteral("other");
    }
    return QStringLiteral("other");
}

CodecProfile CodecClassifier::classify(const QString& fileName,
                                       const std::optional<ProbedCodecs>& probed) {
    CodecProfile profile;
    profile.container = extensionOf(fileName);
    profile.mediaKind = mediaKindFor(fileName);

    if (probed && (!probed->videoCodec.isEmpty() || !probed->audioCodec.isEmpty())) {
        profile.videoCodec = probed->videoCodec.toLower();
        profile.audioCodec = probed->audioCodec.toLower();
        profile.evidence = *probed;
    } else if (auto inferred = inferFromFilename(fileName)) {
        profile.videoCodec = inferred->videoCodec;
        profile.audioCodec = inferred->audioCodec;
        profile.evidence = *inferred;
    }

    const bool badVideo = isIncompatibleVideoCodec(profile.videoCodec);
    const bool badAudio = isIncompatibleAudioCodec(profile.audioCodec);
    const bool badContainer = needsContainerRemux(profile.container);

    if (badVideo) {
        profile.matchedLabels << QStringLiteral("video:%1").arg(profile.videoCodec);
    }
    if (badAudio) {
        profile.matchedLabels << QStringLiteral("audio:%1").arg(profile.audioCodec);
    }
    if (badContainer) {
        profile.matchedLabels << QStringLiteral("container:%1").arg(profile.container);
    }

    if (badVideo && profile.mediaKind != MediaKind::Audio) {
        profile.mode = TranscodeMode::Full;
    } else if (badAudio) {
        profile.mode = TranscodeMode::AudioOnly;
    } else if (badContainer) {
        // Stream copy into MP4 only works for video containers; audio ones carry codecs MP4 rejects
        profile.mode = profile.mediaKind == MediaKind::Audio
            ? TranscodeMode::AudioOnly : TranscodeMode::Remux;
    } else {
        profile.mode = TranscodeMode::None;
    }
    profile.needsTranscoding = profile.mode != TranscodeMode::None;

    return profile;
}

std::optional<FilenameInference> CodecClassifier::inferFromFilename(const QString& fileName) {
    const QString name = QFileInfo(fileName).fileName();
    FilenameInference inference;

    for (const CodecPattern& p : audioPatterns()) {
        if (p.pattern.match(name).hasMatch()) {
            inference.audioCodec = p.codec;
            inference.matchedPatterns << p.pattern.pattern();
            break;
        }
    }
    for (const CodecPattern& p : videoPatterns()) {
        if (p.pattern.match(name).hasMatch()) {
            inference.videoCodec = p.codec;
            inference.matchedPatterns << p.pattern.pattern();
            break;
        }
    }

    if (inference.matchedPatterns.isEmpty()) {
        return std::nullopt;
    }
    return inference;
}

bool CodecClassifier::isIncompatibleVideoCodec(const QString& codec) {
    return !codec.isEmpty() && incompatibleVideoCodecs().contains(codec.toLower());
}

bool CodecClassifier::isIncompatibleAudioCodec(const QString& codec) {
    return !codec.isEmpty() && incompatibleAudioCodecs().contains(codec.toLower());
}

bool CodecClassifier::needsContainerRemux(const QString& extension) {
    return remuxContainers().contains(extension.toLower());
}

MediaKind CodecClassifier::mediaKindFor(const QString& fileName) {
    const QString ext = extensionOf(fileName);
    if (videoExtensions().contains(ext)) {
        return MediaKind::Video;
    }
    if (audioExtensions().contains(ext)) {
        return MediaKind::Audio;
    }
    return MediaKind::Other;
}

QString CodecClassifier::mimeTypeFor(const QString& fileName) {
    return mimeTypes().value(extensionOf(fileName), QStringLiteral("application/octet-stream"));
}

QString CodecClassifier::transcodedMimeType(MediaKind kind) {
    return kind == MediaKind::Audio ? QStringLiteral("audio/mp4") : QStringLiteral("video/mp4");
}

QString CodecClassifier::extensionOf(const QString& fileName) {
    return QFileInfo(fileName).suffix().toLower();
}

std::optional<CodecProfile> CodecProfileCache::find(const QString& infoHash, int fileIndex) const {
    QMutexLocker locker(&mutex_);
    auto it = profiles_.constFind(key(infoHash, fileIndex));
    if (it == profiles_.constEnd()) {
        return std::nullopt;
    }
    return it.value();
}

CodecProfile CodecProfileCache::insert(const QString& infoHash, int fileIndex, const CodecProfile& profile) {
    QMutexLocker locker(&mutex_);
    const QString k = key(infoHash, fileIndex);
    auto it = profiles_.constFind(k);
    if (it != profiles_.constEnd()) {
        return it.value();
    }
    CodecProfile stored = profile;
    stored.computedAt = QDateTime::currentDateTimeUtc();
    profiles_.insert(k, stored);
    return stored;
}

void CodecProfileCache::removeSwarm(const QString& infoHash) {
    QMutexLocker locker(&mutex_);
    const QString prefix = infoHash + QLatin1Char(':');
    for (auto it = profiles_.begin(); it != profiles_.end();) {
        if (it.key().startsWith(prefix)) {
            it = profiles_.erase(it);
        } else {
            ++it;
        }
    }
}

int CodecProfileCache::size() const {
    QMutexLocker locker(&mutex_);
    return profiles_.size();
}

QString CodecProfileCache::key(const QString& infoHash, int fileIndex) {
    return infoHash + QLatin1Char(':') + QString::number(fileIndex);
}

} // namespace Swarmcast
