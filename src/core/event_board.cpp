#include "core/event_board.hpp"

bool CompletionSignal::set()
{
    return resolve(SignalState::DONE, "");
}

bool CompletionSignal::fail(const std::string &reason)
{
    return resolve(SignalState::FAILED, reason);
}

bool CompletionSignal::resolve(SignalState state, const std::string &reason)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SignalState::PENDING)
        {
            return false;
        }
        state_ = state;
        reason_ = reason;
    }
    cv_.notify_all();
    return true;
}

SignalState CompletionSignal::state() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::string CompletionSignal::failureReason() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return reason_;
}

SignalState CompletionSignal::wait() const
{
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this]
             { return state_ != SignalState::PENDING; });
    return state_;
}

SignalState CompletionSignal::waitFor(std::chrono::milliseconds timeout) const
{
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this]
                 { return state_ != SignalState::PENDING; });
    return state_;
}

std::shared_ptr<CompletionSignal> EventBoard::signalFor(const TaskId &task)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto &slot = signals_[task];
    if (!slot)
    {
        slot = std::make_shared<CompletionSignal>();
    }
    return slot;
}

std::shared_ptr<CompletionSignal> EventBoard::find(const TaskId &task) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = signals_.find(task);
    return it == signals_.end() ? nullptr : it->second;
}

bool EventBoard::isDone(const TaskId &task) const
{
    auto signal = find(task);
    return signal && signal->isDone();
}

SignalState EventBoard::state(const TaskId &task) const
{
    auto signal = find(task);
    return signal ? signal->state() : SignalState::PENDING;
}

std::vector<TaskId> EventBoard::resolvedTasks(SignalState state) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TaskId> out;
    for (const auto &entry : signals_)
    {
        if (entry.second->state() == state)
        {
            out.push_back(entry.first);
        }
    }
    return out;
}

size_t EventBoard::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return signals_.size();
}
