#pragma once

#include <memory>
#include <string>
#include "core/rate_limiter.hpp"
#include "core/retry_policy.hpp"

/**
 * @brief Rate limiter and retry policy shared by every call to one service class
 *
 * Each attempt waits for a limiter slot before calling out, so retries are
 * rate limited too.
 */
class GuardedCall
{
public:
    GuardedCall(std::string service_name,
                std::shared_ptr<RateLimiter> limiter,
                std::shared_ptr<RetryPolicy> retry);

    template <typename Func>
    auto call(const std::string &operation_name, Func func) -> decltype(func())
    {
        return retry_->execute(service_name_ + ": " + operation_name, [&]()
                               {
            if (limiter_)
            {
                limiter_->acquire();
            }
            return func(); });
    }

    const std::string &serviceName() const { return service_name_; }
    const std::shared_ptr<RateLimiter> &limiter() const { return limiter_; }
    const std::shared_ptr<RetryPolicy> &retryPolicy() const { return retry_; }

private:
    std::string service_name_;
    std::shared_ptr<RateLimiter> limiter_;
    std::shared_ptr<RetryPolicy> retry_;
};
