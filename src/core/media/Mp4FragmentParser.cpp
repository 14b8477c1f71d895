#include "Mp4FragmentParser.hpp"
#include "../common/Logger.hpp"

#include <QtCore/QtEndian>

namespace Swarmcast {

QList<Mp4Box> Mp4FragmentParser::feed(const QByteArray& data) {
    QList<Mp4Box> boxes;

    if (passthrough_) {
        if (!data.isEmpty()) {
            boxes.append(Mp4Box{QByteArrayLiteral("raw "), data});
        }
        return boxes;
    }

    buffer_.append(data);

    qsizetype offset = 0;
    while (buffer_.size() - offset >= 8) {
        const auto* header = reinterpret_cast<const uchar*>(buffer_.constData() + offset);
        quint64 size = qFromBigEndian<quint32>(header);
        const QByteArray type = buffer_.mid(offset, 8).right(4);
        int headerSize = 8;

        if (size == 1) {
            if (buffer_.size() - offset < 16) {
                break;
            }
            size = qFromBigEndian<quint64>(header + 8);
            headerSize = 16;
        } else if (size == 0) {
            // Extends to end of stream; emitted by flush()
            break;
        }

        if (size < static_cast<quint64>(headerSize) || size > static_cast<quint64>(MAX_BOX_SIZE)) {
            SWARMCAST_WARN("Malformed MP4 box header (size {}), passing output through", size);
            passthrough_ = true;
            boxes.append(Mp4Box{QByteArrayLiteral("raw "), buffer_.mid(offset)});
            buffer_.clear();
            return boxes;
        }

        if (static_cast<quint64>(buffer_.size() - offset) < size) {
            break;
        }

        boxes.append(Mp4Box{type, buffer_.mid(offset, static_cast<qsizetype>(size))});
        offset += static_cast<qsizetype>(size);
    }

    buffer_.remove(0, offset);
    return boxes;
}

QList<Mp4Box> Mp4FragmentParser::flush() {
    QList<Mp4Box> boxes;
    if (!buffer_.isEmpty()) {
        const QByteArray type = buffer_.size() >= 8 ? buffer_.mid(4, 4) : QByteArrayLiteral("raw ");
        boxes.append(Mp4Box{type, buffer_});
        buffer_.clear();
    }
    return boxes;
}

} // namespace Swarmcast
