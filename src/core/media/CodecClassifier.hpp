#pragma once

#include <QtCore/QDateTime>
#include <QtCore/QHash>
#include <QtCore/QMutex>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <optional>
#include <variant>

namespace Swarmcast {

enum class MediaKind {
    Video,
    Audio,
    Other
};

enum class TranscodeMode {
    None,       // serve bytes as-is
    Remux,      // copy both streams into fragmented MP4
    AudioOnly,  // copy video, re-encode audio to AAC
    Full        // re-encode video to H.264 and audio to AAC
};

/// Codec names as reported by a probe or a catalog row
struct ProbedCodecs {
    QString videoCodec;
    QString audioCodec;
    QString container;
};

/// Codecs guessed from release-name tags such as "x265" or "DDP5.1"
struct FilenameInference {
    QString videoCodec;
    QString audioCodec;
    QStringList matchedPatterns;
};

struct NoEvidence {};

using CodecEvidence = std::variant<ProbedCodecs, FilenameInference, NoEvidence>;

/**
 * @brief Classification of one file of a torrent
 */
struct CodecProfile {
    QString videoCodec;
    QString audioCodec;
    QString container;       // lowercase extension
    MediaKind mediaKind = MediaKind::Other;
    TranscodeMode mode = TranscodeMode::None;
    bool needsTranscoding = false;
    CodecEvidence evidence = NoEvidence{};
    QStringList matchedLabels;  // e.g. "audio:eac3", "container:avi"
    QDateTime computedAt;       // set when cached, null straight from classify()

    QString evidenceSource() const;
};

QString transcodeModeName(TranscodeMode mode);
QString mediaKindName(MediaKind kind);

/**
 * @brief Decides whether a file can be played by a browser unchanged
 *
 * Probed codec names win over filename inference; with neither the file is
 * assumed compatible. Every function here is pure.
 */
class CodecClassifier {
public:
    /**
     * @brief Classifies a file
     * @param fileName Name or path inside the torrent
     * @param probed Codec names from a probe or the catalog, if any
     */
    static CodecProfile classify(const QString& fileName,
                                 const std::optional<ProbedCodecs>& probed = std::nullopt);

    /// Filename tag matching, first audio and first video match win
    static std::optional<FilenameInference> inferFromFilename(const QString& fileName);

    static bool isIncompatibleVideoCodec(const QString& codec);
    static bool isIncompatibleAudioCodec(const QString& codec);

    /// Containers browsers cannot demux even with compatible codecs
    static bool needsContainerRemux(const QString& extension);

    static MediaKind mediaKindFor(const QString& fileName);
    static QString mimeTypeFor(const QString& fileName);

    /// Output MIME type of a transcode of a file of @p kind
    static QString transcodedMimeType(MediaKind kind);

    static QString extensionOf(const QString& fileName);
};

/**
 * @brief Thread-safe memo of profiles keyed by (infohash, fileIndex)
 */
class CodecProfileCache {
public:
    std::optional<CodecProfile> find(const QString& infoHash, int fileIndex) const;

    /// Stores @p profile stamped with computedAt unless one exists; returns the stored profile
    CodecProfile insert(const QString& infoHash, int fileIndex, const CodecProfile& profile);

    void removeSwarm(const QString& infoHash);
    int size() const;

    /// "infohash:fileIndex"
    static QString key(const QString& infoHash, int fileIndex);

private:
    mutable QMutex mutex_;
    QHash<QString, CodecProfile> profiles_;
};

} // namespace Swarmcast
