#pragma once

#include <QtCore/QMetaType>
#include <QtCore/QString>

namespace Swarmcast {

/**
 * @brief Typed failures surfaced by the streaming engine
 *
 * The first five are the client-visible taxonomy; the rest refine it for
 * HTTP mapping and diagnostics.
 */
enum class StreamError {
    InvalidIdentifier,   // malformed magnet URI or infohash
    SwarmTimeout,        // no peers, metadata or pieces within the budget
    PoolExhausted,       // transcode ceiling reached
    TranscodeFailed,     // external process crashed or exited non-zero
    RangeUnsupported,    // seek requested on a transcoded stream
    RangeNotSatisfiable,
    FileNotFound,
    CapacityReached,     // concurrent stream ceiling reached
    SwarmUnavailable,    // transport session failure
    BufferOverflow,      // watcher fell too far behind a shared transcode
    RateLimited,
    Cancelled
};

/// Stable machine-readable code, e.g. "swarm_timeout"
QString errorCode(StreamError error);

/// Human-readable description
QString errorMessage(StreamError error);

/// Whether a client may retry the same request later
bool isRetryable(StreamError error);

/// HTTP status used when the error is reported before any body bytes
int httpStatus(StreamError error);

} // namespace Swarmcast

Q_DECLARE_METATYPE(Swarmcast::StreamError)
