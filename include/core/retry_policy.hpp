#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <stdexcept>
#include <string>
#include <thread>
#include "core/generation_errors.hpp"

/**
 * @brief Attempt and backoff settings for one class of remote call
 */
struct RetryOptions
{
    int max_attempts = 3;
    std::chrono::milliseconds initial_backoff{1000};
    double backoff_multiplier = 2.0;
    std::chrono::milliseconds max_backoff{60000};
};

/**
 * @brief One failed attempt, as handed to the failure reporter
 */
struct AttemptFailure
{
    std::string operation;
    int attempt = 0;
    int max_attempts = 0;
    std::string error_kind;
    std::string message;
    bool will_retry = false;
    std::chrono::milliseconds delay{0};
};

/**
 * @brief Bounded retry with exponential backoff around a fallible call
 *
 * Every failed attempt is counted and handed to the injected reporter.
 * TransientRemoteError, ValidationError and unclassified exceptions are
 * retried uniformly; FatalIOError, DependencyFailedError, NotFoundError and
 * ConfigError are reported once and propagate immediately. After the last
 * attempt the last exception propagates unchanged.
 */
class RetryPolicy
{
public:
    using FailureReporter = std::function<void(const AttemptFailure &)>;
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    explicit RetryPolicy(RetryOptions options = RetryOptions(),
                         FailureReporter reporter = nullptr,
                         Sleeper sleeper = nullptr);

    template <typename Func>
    auto execute(const std::string &operation_name, Func func) -> decltype(func())
    {
        for (int attempt = 1; attempt <= options_.max_attempts; ++attempt)
        {
            try
            {
                return func();
            }
            catch (const FatalIOError &e)
            {
                report(operation_name, attempt, e, false, std::chrono::milliseconds(0));
                throw;
            }
            catch (const DependencyFailedError &e)
            {
                report(operation_name, attempt, e, false, std::chrono::milliseconds(0));
                throw;
            }
            catch (const NotFoundError &e)
            {
                report(operation_name, attempt, e, false, std::chrono::milliseconds(0));
                throw;
            }
            catch (const ConfigError &e)
            {
                report(operation_name, attempt, e, false, std::chrono::milliseconds(0));
                throw;
            }
            catch (const std::exception &e)
            {
                if (attempt == options_.max_attempts)
                {
                    report(operation_name, attempt, e, false, std::chrono::milliseconds(0));
                    throw; // Re-throw on final attempt
                }

                auto delay = backoffFor(attempt);
                report(operation_name, attempt, e, true, delay);
                sleeper_(delay);
            }
        }
        throw std::logic_error("All retry attempts failed for operation: " + operation_name);
    }

    /**
     * @brief Delay after the given (1-based) failed attempt
     */
    std::chrono::milliseconds backoffFor(int attempt) const;

    const RetryOptions &options() const { return options_; }

    // Total failed attempts observed by this policy
    uint64_t failedAttempts() const { return failed_attempts_.load(); }

    // Default reporter: warn on retry, error on give-up
    static void logFailure(const AttemptFailure &failure);

private:
    void report(const std::string &operation_name, int attempt, const std::exception &e,
                bool will_retry, std::chrono::milliseconds delay);

    RetryOptions options_;
    FailureReporter reporter_;
    Sleeper sleeper_;
    std::atomic<uint64_t> failed_attempts_{0};
};
