#pragma once

#include <QtCore/QHash>
#include <QtCore/QMutex>
#include <functional>

namespace Swarmcast {

/**
 * @brief One-shot cancellation flag shared between a request and its worker
 *
 * cancel() may be called from any thread. Callbacks registered with
 * onCancel() run once, on the cancelling thread, outside the token's lock.
 */
class CancelToken {
public:
    CancelToken() = default;

    CancelToken(const CancelToken&) = delete;
    CancelToken& operator=(const CancelToken&) = delete;

    void cancel();
    bool isCancelled() const;

    /**
     * @brief Registers @p callback for cancel(); runs it now if already cancelled
     * @return Id for removeCallback(), or -1 if it already ran
     */
    int onCancel(std::function<void()> callback);
    void removeCallback(int id);

private:
    mutable QMutex mutex_;
    bool cancelled_ = false;
    int nextId_ = 0;
    QHash<int, std::function<void()>> callbacks_;
};

/// Removes a callback from a token when it goes out of scope
class CancelCallback {
public:
    CancelCallback(CancelToken* token, std::function<void()> callback)
        : token_(token), id_(token ? token->onCancel(std::move(callback)) : -1) {}
    ~CancelCallback() {
        if (token_ && id_ >= 0) {
            token_->removeCallback(id_);
        }
    }

    CancelCallback(const CancelCallback&) = delete;
    CancelCallback& operator=(const CancelCallback&) = delete;

private:
    CancelToken* token_;
    int id_;
};

} // namespace Swarmcast
