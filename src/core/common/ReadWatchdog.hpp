#pragma once

#include <QtCore/QFuture>
#include <memory>

#include "ByteSource.hpp"

namespace Swarmcast {

/**
 * @brief Cancels a ByteSource if it is still in use after a deadline
 *
 * Bounds a blocking read() that has no timeout of its own. The watch ends
 * when the watchdog is destroyed; the destructor waits for the watch thread.
 */
class ReadWatchdog {
public:
    ReadWatchdog(std::shared_ptr<ByteSource> source, int timeoutMs);
    ~ReadWatchdog();

    ReadWatchdog(const ReadWatchdog&) = delete;
    ReadWatchdog& operator=(const ReadWatchdog&) = delete;

    /// True once the deadline passed and the source was cancelled
    bool fired() const;

private:
    struct State;
    std::shared_ptr<State> state_;
    QFuture<void> future_;
};

} // namespace Swarmcast
