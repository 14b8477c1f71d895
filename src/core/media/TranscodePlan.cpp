#include "TranscodePlan.hpp"

#include <QtCore/QHash>

namespace Swarmcast {

TranscodePlan TranscodePlan::fromProfile(const CodecProfile& profile) {
    TranscodePlan plan;
    plan.mode = profile.mode == TranscodeMode::None ? TranscodeMode::Remux : profile.mode;
    plan.mediaKind = profile.mediaKind;
    plan.inputContainer = profile.container;
    plan.inputVideoCodec = profile.videoCodec;
    plan.inputAudioCodec = profile.audioCodec;
    return plan;
}

QString TranscodePlan::demuxerFor(const QString& extension) {
    static const QHash<QString, QString> demuxers = {
        {"mkv", "matroska"}, {"webm", "matroska"},
        {"mp4", "mov"}, {"m4v", "mov"}, {"mov", "mov"}, {"m4a", "mov"},
        {"avi", "avi"},
        {"flv", "flv"},
        {"ts", "mpegts"}, {"m2ts", "mpegts"}, {"mts", "mpegts"},
        {"wmv", "asf"}, {"wma", "asf"}, {"asf", "asf"},
        {"ogg", "ogg"}, {"ogv", "ogg"},
        {"wav", "wav"},
        {"flac", "flac"},
        {"mp3", "mp3"},
        {"aac", "aac"},
        {"aiff", "aiff"}, {"aif", "aiff"},
        {"ape", "ape"}
    };
    return demuxers.value(extension.toLower());
}

QStringList TranscodePlan::arguments(const Config::TranscodeSettings& settings) const {
    QStringList args;
    args << "-hide_banner" << "-loglevel" << "error"
         << "-threads" << "0"
         << "-probesize" << "20000000"
         << "-analyzeduration" << "10000000";

    const QString demuxer = demuxerFor(inputContainer);
    if (!demuxer.isEmpty()) {
        args << "-f" << demuxer;
    }
    args << "-i" << "pipe:0";

    const bool audioOnlySource = mediaKind == MediaKind::Audio;
    if (audioOnlySource) {
        args << "-map" << "0:a:0?" << "-vn";
    } else {
        args << "-map" << "0:v:0?" << "-map" << "0:a:0?";
    }

    switch (mode) {
        case TranscodeMode::Full:
            if (!audioOnlySource) {
                args << "-c:v" << "libx264"
                     << "-preset" << settings.preset
                     << "-crf" << QString::number(settings.crf)
                     << "-maxrate" << settings.maxVideoBitrate
                     << "-bufsize" << settings.maxVideoBitrate
                     << "-pix_fmt" << "yuv420p"
                     << "-g" << "60" << "-bf" << "0";
            }
            args << "-c:a" << "aac" << "-b:a" << settings.audioBitrate << "-ac" << "2";
            break;

        case TranscodeMode::AudioOnly:
            if (!audioOnlySource) {
                args << "-c:v" << "copy";
            }
            args << "-c:a" << "aac" << "-b:a" << "192k" << "-ac" << "2";
            break;

        case TranscodeMode::Remux:
        case TranscodeMode::None:
            if (!audioOnlySource) {
                args << "-c:v" << "copy";
            }
            args << "-c:a" << "copy";
            break;
    }

    args << "-f" << "mp4"
         << "-movflags" << "frag_keyframe+empty_moov+default_base_moof"
         << "pipe:1";
    return args;
}

QString TranscodePlan::outputMimeType() const {
    return CodecClassifier::transcodedMimeType(mediaKind);
}

} // namespace Swarmcast
