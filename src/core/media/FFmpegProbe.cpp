#include "FFmpegProbe.hpp"
#include "TranscodePlan.hpp"
#include "../common/ReadWatchdog.hpp"
#include "../common/Logger.hpp"

#include <QtCore/QDeadlineTimer>
#include <QtCore/QElapsedTimer>

#include <algorithm>
#include <cstring>

extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libavutil/avutil.h>
#include <libavutil/error.h>
#include <libavutil/mem.h>
}

namespace Swarmcast {

namespace {

constexpr int kAvioBufferSize = 32 * 1024;
constexpr qint64 kReadChunk = 64 * 1024;

struct ProbeIo {
    ByteSource* source = nullptr;
    qint64 budget = 0;
    qint64 consumed = 0;
    QDeadlineTimer deadline;
    QByteArray pending;
    std::optional<StreamError> error;
};

int readPacket(void* opaque, uint8_t* buffer, int bufferSize) {
    auto* io = static_cast<ProbeIo*>(opaque);

    if (io->pending.isEmpty()) {
        if (io->consumed >= io->budget || io->deadline.hasExpired()) {
            return AVERROR_EOF;
        }
        auto chunk = io->source->read(std::min(kReadChunk, io->budget - io->consumed));
        if (chunk.hasError()) {
            io->error = chunk.error();
            return AVERROR(EIO);
        }
        if (chunk.value().isEmpty()) {
            return AVERROR_EOF;
        }
        io->pending = chunk.value();
        io->consumed += io->pending.size();
    }

    const int n = std::min(bufferSize, static_cast<int>(io->pending.size()));
    std::memcpy(buffer, io->pending.constData(), static_cast<size_t>(n));
    io->pending.remove(0, n);
    return n;
}

int interruptCallback(void* opaque) {
    auto* io = static_cast<ProbeIo*>(opaque);
    return io->deadline.hasExpired() ? 1 : 0;
}

QString avErrorString(int averror) {
    char errorBuffer[AV_ERROR_MAX_STRING_SIZE];
    av_strerror(averror, errorBuffer, AV_ERROR_MAX_STRING_SIZE);
    return QString::fromUtf8(errorBuffer);
}

} // namespace

FFmpegProbe::FFmpegProbe(const Config::ProbeSettings& settings)
    : settings_(settings) {
}

std::optional<ProbedCodecs> FFmpegProbe::probe(std::shared_ptr<ByteSource> source,
                                               const QString& fileName) {
    if (!settings_.enabled || !source) {
        return std::nullopt;
    }

    QElapsedTimer timer;
    timer.start();

    ProbeIo io;
    io.source = source.get();
    io.budget = settings_.maxBytes;
    io.deadline = QDeadlineTimer(settings_.timeoutMs);

    ReadWatchdog watchdog(source, settings_.timeoutMs);

    auto* avioBuffer = static_cast<unsigned char*>(av_malloc(kAvioBufferSize));
    if (!avioBuffer) {
        return std::nullopt;
    }
    AVIOContext* avio = avio_alloc_context(avioBuffer, kAvioBufferSize, 0, &io,
                                           &readPacket, nullptr, nullptr);
    if (!avio) {
        av_free(avioBuffer);
        return std::nullopt;
    }
    avio->seekable = 0;

    auto freeAvio = [&avio]() {
        if (avio) {
            av_freep(&avio->buffer);
            avio_context_free(&avio);
        }
    };

    AVFormatContext* formatContext = avformat_alloc_context();
    if (!formatContext) {
        freeAvio();
        return std::nullopt;
    }
    formatContext->pb = avio;
    formatContext->flags |= AVFMT_FLAG_CUSTOM_IO;
    formatContext->probesize = settings_.maxBytes;
    formatContext->max_analyze_duration = 5 * AV_TIME_BASE;
    formatContext->interrupt_callback.callback = &interruptCallback;
    formatContext->interrupt_callback.opaque = &io;

    const AVInputFormat* inputFormat = nullptr;
    const QString demuxer = TranscodePlan::demuxerFor(CodecClassifier::extensionOf(fileName));
    if (!demuxer.isEmpty()) {
        inputFormat = av_find_input_format(demuxer.toUtf8().constData());
    }

    int ret = avformat_open_input(&formatContext, nullptr, inputFormat, nullptr);
    if (ret < 0) {
        // formatContext is freed by avformat_open_input on failure
        SWARMCAST_DEBUG("Probe could not open {}: {}", fileName.toStdString(), avErrorString(ret).toStdString());
        source->cancel();
        freeAvio();
        return std::nullopt;
    }

    ret = avformat_find_stream_info(formatContext, nullptr);
    if (ret < 0) {
        SWARMCAST_DEBUG("Probe found no stream info in {}: {}", fileName.toStdString(), avErrorString(ret).toStdString());
    }

    ProbedCodecs codecs;
    codecs.container = QString::fromUtf8(formatContext->iformat->name);
    for (unsigned int i = 0; i < formatContext->nb_streams; ++i) {
        const AVCodecParameters* codecParams = formatContext->streams[i]->codecpar;
        if (codecParams->codec_id == AV_CODEC_ID_NONE) {
            continue;
        }
        if (codecParams->codec_type == AVMEDIA_TYPE_VIDEO && codecs.videoCodec.isEmpty()) {
            // Cover art is a video stream with a single attached picture
            if (formatContext->streams[i]->disposition & AV_DISPOSITION_ATTACHED_PIC) {
                continue;
            }
            codecs.videoCodec = QString::fromUtf8(avcodec_get_name(codecParams->codec_id));
        } else if (codecParams->codec_type == AVMEDIA_TYPE_AUDIO && codecs.audioCodec.isEmpty()) {
            codecs.audioCodec = QString::fromUtf8(avcodec_get_name(codecParams->codec_id));
        }
    }

    avformat_close_input(&formatContext);
    freeAvio();
    source->cancel();

    if (codecs.videoCodec.isEmpty() && codecs.audioCodec.isEmpty()) {
        SWARMCAST_DEBUG("Probe of {} identified no codecs after {} bytes", fileName.toStdString(), io.consumed);
        return std::nullopt;
    }

    SWARMCAST_INFO("Probed {}: container={} video={} audio={} ({} bytes, {} ms)",
                   fileName.toStdString(), codecs.container.toStdString(),
                   codecs.videoCodec.toStdString(), codecs.audioCodec.toStdString(),
                   io.consumed, timer.elapsed());
    return codecs;
}

} // namespace Swarmcast
