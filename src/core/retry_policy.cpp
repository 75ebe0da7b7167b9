#include "core/retry_policy.hpp"
#include "logging/logger.hpp"
#include <cmath>

RetryPolicy::RetryPolicy(RetryOptions options, FailureReporter reporter, Sleeper sleeper)
    : options_(options), reporter_(std::move(reporter)), sleeper_(std::move(sleeper))
{
    if (options_.max_attempts < 1)
    {
        throw ConfigError("max_attempts must be at least 1, got " + std::to_string(options_.max_attempts));
    }
    if (options_.initial_backoff.count() < 0 || options_.max_backoff.count() < 0)
    {
        throw ConfigError("Backoff delays must not be negative");
    }
    if (options_.backoff_multiplier < 1.0)
    {
        throw ConfigError("backoff_multiplier must be >= 1.0");
    }

    if (!reporter_)
    {
        reporter_ = &RetryPolicy::logFailure;
    }
    if (!sleeper_)
    {
        sleeper_ = [](std::chrono::milliseconds delay)
        { std::this_thread::sleep_for(delay); };
    }
}

std::chrono::milliseconds RetryPolicy::backoffFor(int attempt) const
{
    // initial, initial*m, initial*m^2, ... capped at max_backoff
    double scaled = static_cast<double>(options_.initial_backoff.count()) *
                    std::pow(options_.backoff_multiplier, std::max(0, attempt - 1));
    double capped = std::min(scaled, static_cast<double>(options_.max_backoff.count()));
    return std::chrono::milliseconds(static_cast<long long>(capped));
}

void RetryPolicy::report(const std::string &operation_name, int attempt, const std::exception &e,
                         bool will_retry, std::chrono::milliseconds delay)
{
    failed_attempts_.fetch_add(1);

    AttemptFailure failure;
    failure.operation = operation_name;
    failure.attempt = attempt;
    failure.max_attempts = options_.max_attempts;
    failure.error_kind = errorKindName(e);
    failure.message = e.what();
    failure.will_retry = will_retry;
    failure.delay = delay;

    try
    {
        reporter_(failure);
    }
    catch (const std::exception &report_error)
    {
        Logger::error("Failure reporter threw while reporting '" + operation_name + "': " + report_error.what());
    }
}

void RetryPolicy::logFailure(const AttemptFailure &failure)
{
    if (failure.will_retry)
    {
        Logger::warn("Operation '" + failure.operation + "' failed, retrying in " +
                     std::to_string(failure.delay.count()) + "ms (attempt " +
                     std::to_string(failure.attempt) + "/" + std::to_string(failure.max_attempts) +
                     ") [" + failure.error_kind + "]: " + failure.message);
    }
    else
    {
        Logger::error("Operation '" + failure.operation + "' failed after " +
                      std::to_string(failure.attempt) + " attempt(s) [" + failure.error_kind +
                      "]: " + failure.message);
    }
}
