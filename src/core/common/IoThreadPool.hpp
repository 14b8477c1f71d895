#pragma once

#include <QtCore/QThreadPool>

namespace Swarmcast {

/**
 * @brief Thread pool for blocking stream I/O
 *
 * Piece waits, transcoder feeding and socket pumps block for long periods,
 * so they run here instead of QThreadPool::globalInstance().
 */
QThreadPool* ioThreadPool();

/**
 * @brief Blocks until every ioThreadPool() worker has returned
 *
 * There is no time limit. Events of the calling thread keep being processed
 * so workers blocked on a queued call into it can finish; a warning is
 * logged every @p reportIntervalMs while workers remain.
 */
void drainIoThreadPool(int reportIntervalMs = 10000);

} // namespace Swarmcast
