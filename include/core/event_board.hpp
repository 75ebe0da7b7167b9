#pragma once

#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "core/shot_types.hpp"

enum class SignalState
{
    PENDING,
    DONE,
    FAILED
};

/**
 * @brief One-shot broadcast completion signal
 *
 * Resolves once, to DONE or FAILED, and stays resolved for the rest of the
 * run; later resolutions are ignored. Any number of threads may wait on it;
 * isDone()/state() never block.
 */
class CompletionSignal
{
public:
    // Resolve as DONE; returns false if it was already resolved
    bool set();

    // Resolve as FAILED; returns false if it was already resolved
    bool fail(const std::string &reason);

    SignalState state() const;
    bool isDone() const { return state() == SignalState::DONE; }
    bool isResolved() const { return state() != SignalState::PENDING; }
    std::string failureReason() const;

    // Block until resolved
    SignalState wait() const;

    // Block until resolved or the timeout passes; returns PENDING on timeout
    SignalState waitFor(std::chrono::milliseconds timeout) const;

private:
    bool resolve(SignalState state, const std::string &reason);

    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    SignalState state_ = SignalState::PENDING;
    std::string reason_;
};

/**
 * @brief Per-task completion signals for one run
 */
class EventBoard
{
public:
    // Signal for a task, created on first use
    std::shared_ptr<CompletionSignal> signalFor(const TaskId &task);

    // Existing signal or nullptr
    std::shared_ptr<CompletionSignal> find(const TaskId &task) const;

    bool isDone(const TaskId &task) const;
    SignalState state(const TaskId &task) const;

    std::vector<TaskId> resolvedTasks(SignalState state) const;
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<TaskId, std::shared_ptr<CompletionSignal>> signals_;
};
