#include "core/rate_limiter.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <thread>

namespace
{
    constexpr std::chrono::seconds kMinuteWindow{60};
    constexpr std::chrono::seconds kDayWindow{86400};

    std::chrono::steady_clock::duration spacingFor(int max_requests_per_minute)
    {
        if (max_requests_per_minute <= 0)
        {
            return std::chrono::steady_clock::duration::zero();
        }
        return std::chrono::duration_cast<std::chrono::steady_clock::duration>(kMinuteWindow) /
               max_requests_per_minute;
    }
}

RateLimiter::RateLimiter(int max_requests_per_minute, int max_requests_per_day,
                         std::string name, NowFn now, Sleeper sleeper)
    : max_requests_per_minute_(std::max(0, max_requests_per_minute)),
      max_requests_per_day_(std::max(0, max_requests_per_day)),
      name_(std::move(name)),
      min_spacing_(spacingFor(max_requests_per_minute)),
      now_(std::move(now)),
      sleeper_(std::move(sleeper))
{
    if (!now_)
    {
        now_ = []
        { return std::chrono::steady_clock::now(); };
    }
    if (!sleeper_)
    {
        sleeper_ = [](std::chrono::milliseconds delay)
        { std::this_thread::sleep_for(delay); };
    }
}

void RateLimiter::acquire()
{
    if (!isEnabled())
    {
        return;
    }

    // Held across the waits: callers queue behind the one currently waiting for a slot
    std::lock_guard<std::mutex> lock(mutex_);
    TimePoint now = now_();
    prune(now);
    bool delayed = false;

    if (max_requests_per_day_ > 0 &&
        countSince(now, kDayWindow) >= static_cast<size_t>(max_requests_per_day_))
    {
        auto wait = kDayWindow - (now - oldestSince(now, kDayWindow));
        if (wait > std::chrono::steady_clock::duration::zero())
        {
            double hours = std::chrono::duration<double>(wait).count() / 3600.0;
            std::ostringstream msg;
            msg << std::fixed << std::setprecision(1) << hours;
            Logger::warn("RateLimiter[" + name_ + "]: daily limit reached (" +
                         std::to_string(max_requests_per_day_) + " requests/day), waiting " +
                         msg.str() + " hours");
            now = waitFor(wait);
            delayed = true;
        }
    }

    if (max_requests_per_minute_ > 0)
    {
        if (countSince(now, kMinuteWindow) >= static_cast<size_t>(max_requests_per_minute_))
        {
            auto wait = kMinuteWindow - (now - oldestSince(now, kMinuteWindow));
            if (wait > std::chrono::steady_clock::duration::zero())
            {
                Logger::info("RateLimiter[" + name_ + "]: limit reached (" +
                             std::to_string(max_requests_per_minute_) + " requests/min), waiting " +
                             std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(wait).count()) +
                             "ms");
                now = waitFor(wait);
                delayed = true;
            }
        }

        if (!request_times_.empty())
        {
            auto since_last = now - request_times_.back();
            if (since_last < min_spacing_)
            {
                now = waitFor(min_spacing_ - since_last);
                delayed = true;
            }
        }
    }

    request_times_.push_back(now);
    stats_.granted++;
    if (delayed)
    {
        stats_.delayed++;
    }
}

RateLimiter::Stats RateLimiter::stats() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

std::string RateLimiter::describe() const
{
    if (!isEnabled())
    {
        return "unlimited";
    }
    std::string out;
    if (max_requests_per_minute_ > 0)
    {
        out += std::to_string(max_requests_per_minute_) + " req/min";
    }
    if (max_requests_per_day_ > 0)
    {
        if (!out.empty())
            out += ", ";
        out += std::to_string(max_requests_per_day_) + " req/day";
    }
    return out;
}

void RateLimiter::prune(TimePoint now)
{
    // Keep a day of history when a daily quota applies, otherwise a minute
    auto keep = max_requests_per_day_ > 0 ? std::chrono::duration_cast<std::chrono::steady_clock::duration>(kDayWindow)
                                          : std::chrono::duration_cast<std::chrono::steady_clock::duration>(kMinuteWindow);
    while (!request_times_.empty() && now - request_times_.front() >= keep)
    {
        request_times_.pop_front();
    }
}

size_t RateLimiter::countSince(TimePoint now, std::chrono::seconds window) const
{
    return static_cast<size_t>(std::count_if(request_times_.begin(), request_times_.end(),
                                             [&](const TimePoint &t)
                                             { return now - t < window; }));
}

RateLimiter::TimePoint RateLimiter::oldestSince(TimePoint now, std::chrono::seconds window) const
{
    auto it = std::find_if(request_times_.begin(), request_times_.end(),
                           [&](const TimePoint &t)
                           { return now - t < window; });
    return it == request_times_.end() ? now : *it;
}

RateLimiter::TimePoint RateLimiter::waitFor(std::chrono::steady_clock::duration wait)
{
    // Round up so the window has really elapsed when we wake
    auto wait_ms = std::chrono::ceil<std::chrono::milliseconds>(wait);
    sleeper_(wait_ms);
    stats_.total_wait += wait_ms;

    TimePoint now = now_();
    prune(now);
    return now;
}
