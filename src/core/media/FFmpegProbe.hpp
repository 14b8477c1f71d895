#pragma once

#include <QtCore/QString>
#include <memory>
#include <optional>

#include "../common/ByteSource.hpp"
#include "../common/Config.hpp"
#include "CodecClassifier.hpp"

namespace Swarmcast {

/**
 * @brief Source of codec evidence read from the media bytes themselves
 */
class CodecProbe {
public:
    virtual ~CodecProbe() = default;

    /**
     * @brief Reads the head of a file and reports its codecs
     * @param source Reader positioned at byte 0; consumed and cancelled by the probe
     * @param fileName Used for the container hint
     * @return Codecs, or nullopt if the head alone did not identify them
     */
    virtual std::optional<ProbedCodecs> probe(std::shared_ptr<ByteSource> source,
                                              const QString& fileName) = 0;
};

/**
 * @brief libavformat probe over a custom AVIOContext
 *
 * Never seeks, so containers with their index at the end (MP4 with a
 * trailing moov) usually come back empty and fall through to filename
 * inference. Blocking; run on an ioThreadPool() worker.
 */
class FFmpegProbe : public CodecProbe {
public:
    explicit FFmpegProbe(const Config::ProbeSettings& settings);

    std::optional<ProbedCodecs> probe(std::shared_ptr<ByteSource> source,
                                      const QString& fileName) override;

    qint64 maxBytes() const { return settings_.maxBytes; }

private:
    Config::ProbeSettings settings_;
};

} // namespace Swarmcast
