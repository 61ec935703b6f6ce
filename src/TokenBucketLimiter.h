#pragma once

#include <algorithm>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>

// Per-key token bucket. Buckets are created full on first use and refill
// continuously at refill_per_minute, capped at capacity.
class TokenBucketLimiter {
public:
    using Clock = std::chrono::system_clock;
    using TimePoint = Clock::time_point;

    explicit TokenBucketLimiter(double capacity, double refill_per_minute)
        : capacity_(validate_positive(capacity))
        , refill_per_minute_(refill_per_minute > 0.0 ? refill_per_minute : capacity) {}

    TokenBucketLimiter(const TokenBucketLimiter&) = delete;
    TokenBucketLimiter& operator=(const TokenBucketLimiter&) = delete;

    bool allow(const std::string& key, double cost = 1.0) { return allow(key, cost, Clock::now()); }

    // A denial leaves the bucket untouched apart from the refill.
    bool allow(const std::string& key, double cost, TimePoint now) {
        if(key.empty()) {
            return true;
        }
        if(cost <= 0.0) {
            cost = 1.0;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        auto& bucket = bucket_for(key, now);
        refill(bucket, now);

        if(bucket.tokens >= cost) {
            bucket.tokens -= cost;
            return true;
        }
        return false;
    }

    [[nodiscard]] double get_tokens(const std::string& key) { return get_tokens(key, Clock::now()); }

    [[nodiscard]] double get_tokens(const std::string& key, TimePoint now) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& bucket = bucket_for(key, now);
        refill(bucket, now);
        return bucket.tokens;
    }

    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        buckets_.clear();
    }

    [[nodiscard]] double get_capacity() const { return capacity_; }
    [[nodiscard]] double get_refill_per_minute() const { return refill_per_minute_; }

private:
    struct Bucket {
        double tokens;
        TimePoint last_refill;
    };

    static double validate_positive(double value) {
        if(value <= 0.0) {
            throw std::invalid_argument("Limiter capacity must be positive");
        }
        return value;
    }

    Bucket& bucket_for(const std::string& key, TimePoint now) {
        auto [it, inserted] = buckets_.try_emplace(key, Bucket{capacity_, now});
        return it->second;
    }

    void refill(Bucket& bucket, TimePoint now) const {
        if(now <= bucket.last_refill) {
            return;
        }
        const double elapsed_seconds = std::chrono::duration<double>(now - bucket.last_refill).count();
        bucket.tokens = std::min(capacity_, bucket.tokens + elapsed_seconds * refill_per_minute_ / 60.0);
        bucket.last_refill = now;
    }

    const double capacity_;
    const double refill_per_minute_;
    std::mutex mutex_;
    std::unordered_map<std::string, Bucket> buckets_;
};
