#pragma once

#include <QtCore/QString>
#include <optional>

#include "../common/Expected.hpp"
#include "../common/StreamError.hpp"

namespace Swarmcast {

/**
 * @brief Inclusive byte range resolved against a file size
 */
struct ByteRange {
    qint64 start = 0;
    qint64 end = 0;   // inclusive

    qint64 length() const { return end - start + 1; }
    bool coversWhole(qint64 size) const { return start == 0 && end == size - 1; }

    /// "bytes start-end/size"
    QString contentRange(qint64 size) const;

    /**
     * @brief Resolves an HTTP Range header
     *
     * Supports "bytes=a-b", "bytes=a-" and "bytes=-n" (first range only).
     * A header that does not parse yields nullopt, meaning the whole file.
     * @return The range, nullopt for the whole file, or RangeNotSatisfiable
     */
    static Expected<std::optional<ByteRange>, StreamError> parse(const QString& header, qint64 size);

    /// True for "bytes=0-" and equivalents that request the stream from its start
    static bool isFromStart(const QString& header);
};

} // namespace Swarmcast
