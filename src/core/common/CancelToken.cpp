#include "CancelToken.hpp"

namespace Swarmcast {

void CancelToken::cancel() {
    QHash<int, std::function<void()>> callbacks;
    {
        QMutexLocker locker(&mutex_);
        if (cancelled_) {
            return;
        }
        cancelled_ = true;
        callbacks.swap(callbacks_);
    }
    for (const auto& callback : callbacks) {
        callback();
    }
}

bool CancelToken::isCancelled() const {
    QMutexLocker locker(&mutex_);
    return cancelled_;
}

int CancelToken::onCancel(std::function<void()> callback) {
    {
        QMutexLocker locker(&mutex_);
        if (!cancelled_) {
            const int id = nextId_++;
            callbacks_.insert(id, std::move(callback));
            return id;
        }
    }
    callback();
    return -1;
}

void CancelToken::removeCallback(int id) {
    QMutexLocker locker(&mutex_);
    callbacks_.remove(id);
}

} // namespace Swarmcast
