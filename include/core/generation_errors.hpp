#pragma once

#include <stdexcept>
#include <string>

/**
 * @brief Error taxonomy for generation runs
 *
 * Only TransientRemoteError and ValidationError are recovered locally
 * (by RetryPolicy). Everything else reaches the scheduler, which marks the
 * task failed and propagates the failure to its dependents.
 */

// Network failure, timeout, rate-limit rejection or 5xx from a remote generator
class TransientRemoteError : public std::runtime_error
{
public:
    explicit TransientRemoteError(const std::string &msg) : std::runtime_error(msg) {}
};

// Malformed structured output from a generator
class ValidationError : public std::runtime_error
{
public:
    explicit ValidationError(const std::string &msg) : std::runtime_error(msg) {}
};

// Cache miss; a control-flow signal rather than a failure
class NotFoundError : public std::runtime_error
{
public:
    explicit NotFoundError(const std::string &msg) : std::runtime_error(msg) {}
};

// Disk or environment failure; never retried
class FatalIOError : public std::runtime_error
{
public:
    explicit FatalIOError(const std::string &msg) : std::runtime_error(msg) {}
};

// A prerequisite task ended Failed
class DependencyFailedError : public std::runtime_error
{
public:
    explicit DependencyFailedError(const std::string &msg) : std::runtime_error(msg) {}
};

// Invalid configuration or provider selection, raised at startup
class ConfigError : public std::runtime_error
{
public:
    explicit ConfigError(const std::string &msg) : std::runtime_error(msg) {}
};

/**
 * @brief Short name of an error class, used in logs and run reports
 */
inline std::string errorKindName(const std::exception &e)
{
    if (dynamic_cast<const TransientRemoteError *>(&e))
        return "TransientRemoteError";
    if (dynamic_cast<const ValidationError *>(&e))
        return "ValidationError";
    if (dynamic_cast<const NotFoundError *>(&e))
        return "NotFoundError";
    if (dynamic_cast<const FatalIOError *>(&e))
        return "FatalIOError";
    if (dynamic_cast<const DependencyFailedError *>(&e))
        return "DependencyFailedError";
    if (dynamic_cast<const ConfigError *>(&e))
        return "ConfigError";
    return "UnclassifiedError";
}
