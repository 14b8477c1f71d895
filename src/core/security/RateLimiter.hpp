#pragma once

#include <QtCore/QHash>
#include <QtCore/QMutex>
#include <QtCore/QQueue>
#include <QtCore/QString>
#include <functional>
#include <memory>

#include "../common/Config.hpp"

namespace Swarmcast {

struct RateLimitResult {
    bool allowed = true;
    int remaining = 0;
    qint64 resetAtMs = 0;      // clock time at which the caller regains capacity
    int retryAfterSeconds = 0; // 0 when allowed
};

/**
 * @brief Per-identity request limiter
 *
 * check() both tests and records: an allowed request consumes capacity.
 * Identities are opaque strings (peer address or forwarded client address).
 */
class RateLimiter {
public:
    using Clock = std::function<qint64()>;

    virtual ~RateLimiter() = default;

    virtual RateLimitResult check(const QString& identity) = 0;
    virtual void reset(const QString& identity) = 0;

    /// Drops state for identities that have fully recovered
    virtual void prune() = 0;
    virtual int trackedIdentities() const = 0;

    /// Monotonic milliseconds
    static Clock steadyClock();
};

class SlidingWindowRateLimiter : public RateLimiter {
public:
    SlidingWindowRateLimiter(int maxRequests, qint64 windowMs, Clock clock = steadyClock());

    RateLimitResult check(const QString& identity) override;
    void reset(const QString& identity) override;
    void prune() override;
    int trackedIdentities() const override;

private:
    void expire(QQueue<qint64>& timestamps, qint64 now) const;

    const int maxRequests_;
    const qint64 windowMs_;
    Clock clock_;

    mutable QMutex mutex_;
    QHash<QString, QQueue<qint64>> requests_;
};

class TokenBucketRateLimiter : public RateLimiter {
public:
    /// @param refillPerSecond tokens added per second, bucket holds @p capacity
    TokenBucketRateLimiter(int capacity, double refillPerSecond, Clock clock = steadyClock());

    RateLimitResult check(const QString& identity) override;
    void reset(const QString& identity) override;
    void prune() override;
    int trackedIdentities() const override;

private:
    struct Bucket {
        double tokens = 0.0;
        qint64 lastRefill = 0;
    };

    void refill(Bucket& bucket, qint64 now) const;

    const int capacity_;
    const double refillPerSecond_;
    Clock clock_;

    mutable QMutex mutex_;
    QHash<QString, Bucket> buckets_;
};

/// Limiters for the "stream" and "metadata" request classes
struct RateLimitPresets {
    std::unique_ptr<RateLimiter> stream;
    std::unique_ptr<RateLimiter> metadata;

    static RateLimitPresets fromSettings(const Config::RateLimitSettings& settings,
                                         RateLimiter::Clock clock = RateLimiter::steadyClock());
};

} // namespace Swarmcast
