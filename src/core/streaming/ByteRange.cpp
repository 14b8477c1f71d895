#include "ByteRange.hpp"

#include <QtCore/QRegularExpression>

#include <algorithm>

namespace Swarmcast {

namespace {

const QRegularExpression& rangePattern() {
    static const QRegularExpression pattern(QStringLiteral(R"(^\s*bytes\s*=\s*(\d*)\s*-\s*(\d*)\s*(?:,.*)?$)"),
                                            QRegularExpression::CaseInsensitiveOption);
    return pattern;
}

} // namespace

QString ByteRange::contentRange(qint64 size) const {
    return QStringLiteral("bytes %1-%2/%3").arg(start).arg(end).arg(size);
}

Expected<std::optional<ByteRange>, StreamError> ByteRange::parse(const QString& header, qint64 size) {
    if (header.trimmed().isEmpty()) {
        return std::optional<ByteRange>();
    }

    const QRegularExpressionMatch match = rangePattern().match(header);
    if (!match.hasMatch()) {
        return std::optional<ByteRange>();
    }

    const QString first = match.captured(1);
    const QString second = match.captured(2);
    if (first.isEmpty() && second.isEmpty()) {
        return std::optional<ByteRange>();
    }

    bool ok = true;
    ByteRange range;

    if (first.isEmpty()) {
        // Suffix range: last n bytes
        const qint64 suffix = second.toLongLong(&ok);
        if (!ok || suffix <= 0 || size <= 0) {
            return makeUnexpected(StreamError::RangeNotSatisfiable);
        }
        range.start = std::max<qint64>(0, size - suffix);
        range.end = size - 1;
        return std::optional<ByteRange>(range);
    }

    range.start = first.toLongLong(&ok);
    if (!ok) {
        return std::optional<ByteRange>();
    }
    if (second.isEmpty()) {
        range.end = size - 1;
    } else {
        range.end = second.toLongLong(&ok);
        if (!ok) {
            return std::optional<ByteRange>();
        }
    }

    if (range.start >= size || range.end >= size || range.start > range.end) {
        return makeUnexpected(StreamError::RangeNotSatisfiable);
    }
    return std::optional<ByteRange>(range);
}

bool ByteRange::isFromStart(const QString& header) {
    const QRegularExpressionMatch match = rangePattern().match(header);
    if (!match.hasMatch()) {
        return true;
    }
    const QString first = match.captured(1);
    if (first.isEmpty()) {
        return match.captured(2).isEmpty();
    }
    return first.toLongLong() == 0;
}

} // namespace Swarmcast
