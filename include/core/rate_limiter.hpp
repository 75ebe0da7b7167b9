#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>

/**
 * @brief Request-rate guard shared by every task calling one class of remote service
 *
 * Two independent rolling-window quotas: requests per minute and requests per
 * day. A quota of 0 disables that check; with both disabled acquire() returns
 * immediately. acquire() never fails, it only delays. Past the daily quota the
 * caller is suspended until the oldest request leaves the 24h window.
 *
 * Consecutive requests are also spaced by at least 60s / requests_per_minute,
 * so bursts are smoothed rather than admitted back to back.
 */
class RateLimiter
{
public:
    using TimePoint = std::chrono::steady_clock::time_point;
    using NowFn = std::function<TimePoint()>;
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    struct Stats
    {
        uint64_t granted = 0;
        uint64_t delayed = 0;
        std::chrono::milliseconds total_wait{0};
    };

    RateLimiter(int max_requests_per_minute, int max_requests_per_day,
                std::string name = "remote",
                NowFn now = nullptr, Sleeper sleeper = nullptr);

    RateLimiter(const RateLimiter &) = delete;
    RateLimiter &operator=(const RateLimiter &) = delete;

    // Block until a request slot is available, then record it
    void acquire();

    bool isEnabled() const { return max_requests_per_minute_ > 0 || max_requests_per_day_ > 0; }
    int maxRequestsPerMinute() const { return max_requests_per_minute_; }
    int maxRequestsPerDay() const { return max_requests_per_day_; }
    const std::string &name() const { return name_; }

    Stats stats() const;

    // "10 req/min, 500 req/day" style description for startup logs
    std::string describe() const;

private:
    void prune(TimePoint now);
    size_t countSince(TimePoint now, std::chrono::seconds window) const;
    TimePoint oldestSince(TimePoint now, std::chrono::seconds window) const;
    TimePoint waitFor(std::chrono::steady_clock::duration wait);

    const int max_requests_per_minute_;
    const int max_requests_per_day_;
    const std::string name_;
    const std::chrono::steady_clock::duration min_spacing_;

    NowFn now_;
    Sleeper sleeper_;

    mutable std::mutex mutex_;
    std::deque<TimePoint> request_times_;
    Stats stats_;
};
