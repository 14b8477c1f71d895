#include "StreamError.hpp"

namespace Swarmcast {

QString errorCode(StreamError error) {
    switch (error) {
        case StreamError::InvalidIdentifier:   return QStringLiteral("invalid_identifier");
        case StreamError::SwarmTimeout:        return QStringLiteral("swarm_timeout");
        case StreamError::PoolExhausted:       return QStringLiteral("pool_exhausted");
        case StreamError::TranscodeFailed:     return QStringLiteral("transcode_failed");
        case StreamError::RangeUnsupported:    return QStringLiteral("range_unsupported");
        case StreamError::RangeNotSatisfiable: return QStringLiteral("range_not_satisfiable");
        case StreamError::FileNotFound:        return QStringLiteral("file_not_found");
        case StreamError::CapacityReached:     return QStringLiteral("capacity_reached");
        case StreamError::SwarmUnavailable:    return QStringLiteral("swarm_unavailable");
        case StreamError::BufferOverflow:      return QStringLiteral("buffer_overflow");
        case StreamError::RateLimited:         return QStringLiteral("rate_limited");
        case StreamError::Cancelled:           return QStringLiteral("cancelled");
    }
    return QStringLiteral("unknown");
}

QString errorMessage(StreamError error) {
    switch (error) {
        case StreamError::InvalidIdentifier:
            return QStringLiteral("Invalid magnet URI or infohash");
        case StreamError::SwarmTimeout:
            return QStringLiteral("Timed out waiting for peers or data");
        case StreamError::PoolExhausted:
            return QStringLiteral("All transcoders are busy, try again shortly");
        case StreamError::TranscodeFailed:
            return QStringLiteral("Transcoding process failed");
        case StreamError::RangeUnsupported:
            return QStringLiteral("Seeking is not supported on transcoded streams");
        case StreamError::RangeNotSatisfiable:
            return QStringLiteral("Requested range not satisfiable");
        case StreamError::FileNotFound:
            return QStringLiteral("File index out of range");
        case StreamError::CapacityReached:
            return QStringLiteral("Maximum concurrent streams reached");
        case StreamError::SwarmUnavailable:
            return QStringLiteral("Torrent session unavailable");
        case StreamError::BufferOverflow:
            return QStringLiteral("Client fell too far behind the stream");
        case StreamError::RateLimited:
            return QStringLiteral("Too many requests");
        case StreamError::Cancelled:
            return QStringLiteral("Stream cancelled");
    }
    return QStringLiteral("Unknown error");
}

bool isRetryable(StreamError error) {
    switch (error) {
        case StreamError::SwarmTimeout:
        case StreamError::PoolExhausted:
        case StreamError::CapacityReached:
        case StreamError::SwarmUnavailable:
        case StreamError::BufferOverflow:
        case StreamError::RateLimited:
        case StreamError::TranscodeFailed:
            return true;
        default:
            return false;
    }
}

int httpStatus(StreamError error) {
    switch (error) {
        case StreamError::InvalidIdentifier:   return 400;
        case StreamError::FileNotFound:        return 404;
        case StreamError::RangeUnsupported:
        case StreamError::RangeNotSatisfiable: return 416;
        case StreamError::RateLimited:         return 429;
        case StreamError::PoolExhausted:
        case StreamError::CapacityReached:     return 503;
        case StreamError::SwarmTimeout:        return 504;
        case StreamError::TranscodeFailed:
        case StreamError::SwarmUnavailable:    return 502;
        case StreamError::BufferOverflow:
        case StreamError::Cancelled:           return 500;
    }
    return 500;
}

} // namespace Swarmcast
