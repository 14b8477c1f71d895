#pragma once

#include <QtCore/QByteArray>
#include <QtCore/QList>

namespace Swarmcast {

struct Mp4Box {
    QByteArray type;   // four-character code
    QByteArray bytes;  // whole box including its header

    bool isFragmentStart() const { return type == "moof"; }
};

/**
 * @brief Splits a fragmented MP4 byte stream into top-level boxes
 *
 * Handles 32-bit and 64-bit (size == 1) box headers. A malformed header
 * switches the parser to pass-through: everything after it is returned as
 * opaque "raw" chunks.
 */
class Mp4FragmentParser {
public:
    /// Appends @p data and returns every box completed by it
    QList<Mp4Box> feed(const QByteArray& data);

    /// Returns any trailing bytes (e.g. a size == 0 box) as a final chunk
    QList<Mp4Box> flush();

    bool isPassthrough() const { return passthrough_; }
    qint64 bufferedBytes() const { return buffer_.size(); }

    static constexpr qint64 MAX_BOX_SIZE = 256LL * 1024 * 1024;

private:
    QByteArray buffer_;
    bool passthrough_ = false;
};

} // namespace Swarmcast
