#include "TranscodePool.hpp"
#include "../common/Logger.hpp"

#include <QtCore/QDeadlineTimer>
#include <QtCore/QThread>
#include <QtCore/QTimer>

namespace Swarmcast {

TranscodePool::TranscodePool(const Config::TranscodeSettings& settings, QObject* parent)
    : QObject(parent)
    , settings_(settings)
    , commandFactory_(ffmpegCommandFactory(settings)) {
}

TranscodePool::~TranscodePool() {
    QMutexLocker locker(&mutex_);
    // Sessions are children and are destroyed with the pool; their destructors kill the processes
    for (TranscodeSession* session : sessions_) {
        session->disconnect(this);
    }
    for (TranscodeSession* session : retiring_) {
        session->disconnect(this);
    }
}

void TranscodePool::setCommandFactory(TranscodeCommandFactory factory) {
    QMutexLocker locker(&mutex_);
    commandFactory_ = std::move(factory);
}

TranscodeCommandFactory TranscodePool::ffmpegCommandFactory(const Config::TranscodeSettings& settings) {
    return [settings](const TranscodePlan& plan) {
        return TranscodeCommand{settings.ffmpegPath, plan.arguments(settings)};
    };
}

QString TranscodePool::keyFor(const QString& infoHash, int fileIndex) {
    return infoHash + QLatin1Char(':') + QString::number(fileIndex);
}

int TranscodePool::occupiedLocked() const {
    return sessions_.size() + retiring_.size() + starting_.size();
}

Expected<TranscodeLease, StreamError> TranscodePool::acquire(const QString& infoHash, int fileIndex,
                                                             const QString& watcherId,
                                                             const SourceFactory& sourceFactory,
                                                             const TranscodePlan& plan,
                                                             CancelToken* cancel) {
    const QString key = keyFor(infoHash, fileIndex);
    // Registered before locking; an already cancelled token runs the callback right here
    CancelCallback wakeOnCancel(cancel, [this]() {
        QMutexLocker locker(&mutex_);
        slotFreed_.wakeAll();
    });
    QMutexLocker locker(&mutex_);
    QDeadlineTimer deadline(settings_.queueWaitMs);

    while (true) {
        if (cancel && cancel->isCancelled()) {
            SWARMCAST_DEBUG("Transcode acquire for {} cancelled", watcherId.toStdString());
            return makeUnexpected(StreamError::Cancelled);
        }
        if (TranscodeSession* session = sessions_.value(key)) {
            auto channel = session->subscribe(watcherId);
            if (channel) {
                watchers_.insert(watcherId, key);
                ++graceGeneration_[key];
                SWARMCAST_DEBUG("Watcher {} joined transcode {}", watcherId.toStdString(), session->id().toStdString());
                return TranscodeLease{session->id(), channel.value(), plan.outputMimeType()};
            }
            // Ended but not yet reaped
            retireLocked(key);
            continue;
        }

        if (!starting_.contains(key) && occupiedLocked() < settings_.maxProcesses) {
            starting_.insert(key);
            locker.unlock();

            auto source = sourceFactory();
            TranscodeSession* session = nullptr;
            if (source) {
                if (QThread::currentThread() == thread()) {
                    session = createSession(infoHash, fileIndex, plan, source.value());
                } else {
                    QMetaObject::invokeMethod(this, [&]() {
                        session = createSession(infoHash, fileIndex, plan, source.value());
                    }, Qt::BlockingQueuedConnection);
                }
            }

            locker.relock();
            starting_.remove(key);
            slotFreed_.wakeAll();

            if (!source) {
                return makeUnexpected(source.error());
            }
            if (!session || sessions_.value(key) != session) {
                return makeUnexpected(StreamError::TranscodeFailed);
            }

            auto channel = session->subscribe(watcherId);
            if (!channel) {
                retireLocked(key);
                return makeUnexpected(StreamError::TranscodeFailed);
            }
            watchers_.insert(watcherId, key);
            return TranscodeLease{session->id(), channel.value(), plan.outputMimeType()};
        }

        ++queued_;
        const bool woken = slotFreed_.wait(&mutex_, deadline);
        --queued_;
        if (!woken && deadline.hasExpired()) {
            SWARMCAST_WARN("Transcode pool exhausted ({} of {} processes), {}#{} rejected",
                           occupiedLocked(), settings_.maxProcesses, infoHash.toStdString(), fileIndex);
            return makeUnexpected(StreamError::PoolExhausted);
        }
    }
}

TranscodeSession* TranscodePool::createSession(const QString& infoHash, int fileIndex,
                                               const TranscodePlan& plan,
                                               std::shared_ptr<ByteSource> source) {
    TranscodeCommand command;
    {
        QMutexLocker locker(&mutex_);
        command = commandFactory_(plan);
    }

    auto* session = new TranscodeSession(infoHash, fileIndex, plan, settings_, this);
    auto started = session->start(command, std::move(source));
    if (!started) {
        delete session;
        return nullptr;
    }

    connect(session, &TranscodeSession::finished, this, &TranscodePool::onSessionFinished);
    connect(session, &TranscodeSession::subscriberDropped, this, &TranscodePool::onSubscriberDropped);

    {
        // Inserted before any of the session's events can run
        QMutexLocker locker(&mutex_);
        sessions_.insert(keyFor(infoHash, fileIndex), session);
    }

    emit sessionStarted(infoHash, fileIndex, session->id());
    return session;
}

void TranscodePool::release(const QString& watcherId) {
    QMutexLocker locker(&mutex_);
    const QString key = watchers_.take(watcherId);
    if (key.isEmpty()) {
        return;
    }

    TranscodeSession* session = sessions_.value(key);
    if (!session) {
        return;
    }
    if (session->unsubscribe(watcherId) == 0) {
        scheduleGrace(key);
    }
}

void TranscodePool::scheduleGrace(const QString& key) {
    const quint64 generation = ++graceGeneration_[key];
    SWARMCAST_DEBUG("Transcode {} idle, stopping in {} ms unless rejoined", key.toStdString(), settings_.graceMs);
    QMetaObject::invokeMethod(this, [this, key, generation]() {
        QTimer::singleShot(settings_.graceMs, this, [this, key, generation]() {
            onGraceExpired(key, generation);
        });
    }, Qt::QueuedConnection);
}

void TranscodePool::onGraceExpired(const QString& key, quint64 generation) {
    TranscodeSession* session = nullptr;
    {
        QMutexLocker locker(&mutex_);
        if (graceGeneration_.value(key) != generation) {
            return;
        }
        session = sessions_.value(key);
        if (!session || session->subscriberCount() > 0) {
            return;
        }
        retireLocked(key);
    }
    session->stop(StreamError::Cancelled);
}

void TranscodePool::retireLocked(const QString& key) {
    TranscodeSession* session = sessions_.take(key);
    if (!session) {
        return;
    }
    retiring_.insert(session);
    graceGeneration_.remove(key);
    for (auto it = watchers_.begin(); it != watchers_.end();) {
        if (it.value() == key) {
            it = watchers_.erase(it);
        } else {
            ++it;
        }
    }
}

void TranscodePool::terminate(const QString& infoHash, int fileIndex) {
    TranscodeSession* session = nullptr;
    {
        QMutexLocker locker(&mutex_);
        const QString key = keyFor(infoHash, fileIndex);
        session = sessions_.value(key);
        if (!session) {
            return;
        }
        retireLocked(key);
    }
    QMetaObject::invokeMethod(session, [session]() {
        session->stop(StreamError::Cancelled);
    }, Qt::AutoConnection);
}

void TranscodePool::terminateAll() {
    QList<TranscodeSession*> sessions;
    {
        QMutexLocker locker(&mutex_);
        const QStringList keys = sessions_.keys();
        for (const QString& key : keys) {
            sessions.append(sessions_.value(key));
            retireLocked(key);
        }
    }
    for (TranscodeSession* session : sessions) {
        QMetaObject::invokeMethod(session, [session]() {
            session->stop(StreamError::Cancelled);
        }, Qt::AutoConnection);
    }
}

void TranscodePool::onSessionFinished(const QString& sessionId, bool success) {
    auto* session = qobject_cast<TranscodeSession*>(sender());
    if (!session) {
        return;
    }

    {
        QMutexLocker locker(&mutex_);
        const QString key = keyFor(session->infoHash(), session->fileIndex());
        if (sessions_.value(key) == session) {
            retireLocked(key);
        }
        retiring_.remove(session);
        slotFreed_.wakeAll();
    }

    emit sessionEnded(session->infoHash(), session->fileIndex(), sessionId, success);
    session->deleteLater();
}

void TranscodePool::onSubscriberDropped(const QString& sessionId, const QString& watcherId) {
    QMutexLocker locker(&mutex_);
    const QString key = watchers_.value(watcherId);
    TranscodeSession* session = sessions_.value(key);
    if (!session || session->id() != sessionId) {
        return;
    }
    watchers_.remove(watcherId);
    if (session->subscriberCount() == 0) {
        scheduleGrace(key);
    }
}

bool TranscodePool::hasSession(const QString& infoHash, int fileIndex) const {
    QMutexLocker locker(&mutex_);
    return sessions_.contains(keyFor(infoHash, fileIndex));
}

int TranscodePool::activeCount() const {
    QMutexLocker locker(&mutex_);
    return sessions_.size() + retiring_.size();
}

TranscodePoolStats TranscodePool::stats() const {
    QMutexLocker locker(&mutex_);
    TranscodePoolStats stats;
    stats.activeProcesses = sessions_.size() + retiring_.size();
    stats.maxProcesses = settings_.maxProcesses;
    stats.queuedAcquirers = queued_;
    for (TranscodeSession* session : sessions_) {
        stats.sessions.append(session->info());
    }
    for (TranscodeSession* session : retiring_) {
        stats.sessions.append(session->info());
    }
    return stats;
}

} // namespace Swarmcast
