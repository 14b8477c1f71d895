#include "RateLimiter.hpp"

#include <QtCore/QElapsedTimer>

#include <algorithm>
#include <cmath>

namespace Swarmcast {

RateLimiter::Clock RateLimiter::steadyClock() {
    auto timer = std::make_shared<QElapsedTimer>();
    timer->start();
    return [timer]() { return timer->elapsed(); };
}

SlidingWindowRateLimiter::SlidingWindowRateLimiter(int maxRequests, qint64 windowMs, Clock clock)
    : maxRequests_(std::max(1, maxRequests))
    , windowMs_(std::max<qint64>(1, windowMs))
    , clock_(std::move(clock)) {
}

void SlidingWindowRateLimiter::expire(QQueue<qint64>& timestamps, qint64 now) const {
    const qint64 cutoff = now - windowMs_;
    while (!timestamps.isEmpty() && timestamps.head() <= cutoff) {
        timestamps.dequeue();
    }
}

RateLimitResult SlidingWindowRateLimiter::check(const QString& identity) {
    const qint64 now = clock_();
    QMutexLocker locker(&mutex_);
    QQueue<qint64>& timestamps = requests_[identity];
    expire(timestamps, now);

    RateLimitResult result;
    result.allowed = timestamps.size() < maxRequests_;
    if (result.allowed) {
        timestamps.enqueue(now);
    }
    result.remaining = std::max(0, maxRequests_ - static_cast<int>(timestamps.size()));
    result.resetAtMs = timestamps.head() + windowMs_;
    if (!result.allowed) {
        const qint64 waitMs = std::max<qint64>(0, result.resetAtMs - now);
        result.retryAfterSeconds = std::max(1, static_cast<int>((waitMs + 999) / 1000));
    }
    return result;
}

void SlidingWindowRateLimiter::reset(const QString& identity) {
    QMutexLocker locker(&mutex_);
    requests_.remove(identity);
}

void SlidingWindowRateLimiter::prune() {
    const qint64 now = clock_();
    QMutexLocker locker(&mutex_);
    for (auto it = requests_.begin(); it != requests_.end();) {
        expire(it.value(), now);
        if (it.value().isEmpty()) {
            it = requests_.erase(it);
        } else {
            ++it;
        }
    }
}

int SlidingWindowRateLimiter::trackedIdentities() const {
    QMutexLocker locker(&mutex_);
    return requests_.size();
}

TokenBucketRateLimiter::TokenBucketRateLimiter(int capacity, double refillPerSecond, Clock clock)
    : capacity_(std::max(1, capacity))
    , refillPerSecond_(refillPerSecond > 0.0 ? refillPerSecond : 1.0)
    , clock_(std::move(clock)) {
}

void TokenBucketRateLimiter::refill(Bucket& bucket, qint64 now) const {
    const double elapsedSeconds = static_cast<double>(now - bucket.lastRefill) / 1000.0;
    if (elapsedSeconds > 0.0) {
        bucket.tokens = std::min(static_cast<double>(capacity_), bucket.tokens + elapsedSeconds * refillPerSecond_);
        bucket.lastRefill = now;
    }
}

RateLimitResult TokenBucketRateLimiter::check(const QString& identity) {
    const qint64 now = clock_();
    QMutexLocker locker(&mutex_);
    auto it = buckets_.find(identity);
    if (it == buckets_.end()) {
        it = buckets_.insert(identity, Bucket{static_cast<double>(capacity_), now});
    }
    Bucket& bucket = it.value();
    refill(bucket, now);

    RateLimitResult result;
    result.allowed = bucket.tokens >= 1.0;
    if (result.allowed) {
        bucket.tokens -= 1.0;
    }
    result.remaining = static_cast<int>(std::floor(bucket.tokens));

    const double missing = static_cast<double>(capacity_) - bucket.tokens;
    result.resetAtMs = now + static_cast<qint64>(std::ceil(missing / refillPerSecond_ * 1000.0));
    if (!result.allowed) {
        const double untilNext = (1.0 - bucket.tokens) / refillPerSecond_;
        result.retryAfterSeconds = std::max(1, static_cast<int>(std::ceil(untilNext)));
    }
    return result;
}

void TokenBucketRateLimiter::reset(const QString& identity) {
    QMutexLocker locker(&mutex_);
    buckets_.remove(identity);
}

void TokenBucketRateLimiter::prune() {
    const qint64 now = clock_();
    QMutexLocker locker(&mutex_);
    for (auto it = buckets_.begin(); it != buckets_.end();) {
        refill(it.value(), now);
        if (it.value().tokens >= capacity_) {
            it = buckets_.erase(it);
        } else {
            ++it;
        }
    }
}

int TokenBucketRateLimiter::trackedIdentities() const {
    QMutexLocker locker(&mutex_);
    return buckets_.size();
}

RateLimitPresets RateLimitPresets::fromSettings(const Config::RateLimitSettings& settings,
                                                RateLimiter::Clock clock) {
    RateLimitPresets presets;
    presets.stream = std::make_unique<SlidingWindowRateLimiter>(settings.streamRequestsPerWindow,
                                                                settings.windowMs, clock);
    presets.metadata = std::make_unique<SlidingWindowRateLimiter>(settings.metadataRequestsPerWindow,
                                                                  settings.windowMs, clock);
    return presets;
}

} // namespace Swarmcast
