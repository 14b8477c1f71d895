#pragma once

#include <QtCore/QString>
#include <QtCore/QStringList>

#include "../common/Config.hpp"
#include "CodecClassifier.hpp"

namespace Swarmcast {

/**
 * @brief Command line for one ffmpeg transcode reading stdin and writing
 * fragmented MP4 to stdout
 */
struct TranscodePlan {
    TranscodeMode mode = TranscodeMode::Full;
    MediaKind mediaKind = MediaKind::Video;
    QString inputContainer;   // lowercase extension of the source file
    QString inputVideoCodec;
    QString inputAudioCodec;

    static TranscodePlan fromProfile(const CodecProfile& profile);

    /// ffmpeg demuxer name for a container extension, empty to let ffmpeg probe
    static QString demuxerFor(const QString& extension);

    /// Arguments after the program name
    QStringList arguments(const Config::TranscodeSettings& settings) const;

    QString outputMimeType() const;
};

} // namespace Swarmcast
