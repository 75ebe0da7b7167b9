#include "core/shutdown_manager.hpp"
#include "logging/logger.hpp"
#include <chrono>
#include <vector>

volatile sig_atomic_t ShutdownManager::signal_flag_ = 0;
volatile sig_atomic_t ShutdownManager::signal_num_ = 0;
volatile sig_atomic_t ShutdownManager::signal_count_ = 0;

ShutdownManager &ShutdownManager::getInstance()
{
    static ShutdownManager instance;
    return instance;
}

ShutdownManager::~ShutdownManager()
{
    stopWatcher();
}

void ShutdownManager::installSignalHandlers()
{
    std::signal(SIGINT, &ShutdownManager::handleSignal);
    std::signal(SIGTERM, &ShutdownManager::handleSignal);

    startWatcher();
    Logger::debug("Signal handlers installed");
}

void ShutdownManager::handleSignal(int sig) noexcept
{
    if (signal_count_ > 0)
    {
        std::signal(sig, SIG_DFL);
        std::raise(sig);
        return;
    }
    signal_count_ = 1;
    signal_num_ = sig;
    signal_flag_ = 1;
}

void ShutdownManager::startWatcher()
{
    if (watcher_running_.exchange(true))
    {
        return;
    }
    watcher_ = std::thread([this]()
                           {
        while (watcher_running_.load())
        {
            if (signal_flag_)
            {
                int sig = signal_num_;
                signal_flag_ = 0;
                requestShutdown("interrupted by signal", sig);
            }
            if (shutdown_requested_.load())
            {
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        } });
}

void ShutdownManager::stopWatcher()
{
    watcher_running_.store(false);
    if (watcher_.joinable())
    {
        watcher_.join();
    }
}

void ShutdownManager::requestShutdown(const std::string &reason, int signal_number) noexcept
{
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (shutdown_requested_.load())
        {
            return;
        }
        reason_ = reason;
        last_signal_.store(signal_number);
        shutdown_requested_.store(true);
    }
    cv_.notify_all();

    if (signal_number != 0)
    {
        Logger::warn("Received signal " + std::to_string(signal_number) +
                     ": stopping after in-flight tasks, cached artifacts are kept (signal again to abort now)");
    }
    else
    {
        Logger::info("Shutdown requested: " + reason);
    }

    runHooks();
}

void ShutdownManager::runHooks() noexcept
{
    std::lock_guard<std::recursive_mutex> lk(hooks_mutex_);
    std::vector<StopHook> hooks;
    for (const auto &entry : hooks_)
    {
        hooks.push_back(entry.second);
    }
    for (const auto &hook : hooks)
    {
        try
        {
            hook();
        }
        catch (const std::exception &e)
        {
            Logger::error("Stop hook failed: " + std::string(e.what()));
        }
    }
}

int ShutdownManager::addStopHook(StopHook hook)
{
    int id;
    {
        std::lock_guard<std::recursive_mutex> lk(hooks_mutex_);
        id = next_hook_id_++;
        hooks_[id] = hook;
    }
    if (shutdown_requested_.load())
    {
        hook();
    }
    return id;
}

void ShutdownManager::removeStopHook(int id)
{
    std::lock_guard<std::recursive_mutex> lk(hooks_mutex_);
    hooks_.erase(id);
}

void ShutdownManager::waitForShutdown()
{
    std::unique_lock<std::mutex> lk(mutex_);
    cv_.wait(lk, [this]
             { return shutdown_requested_.load(); });
}

std::string ShutdownManager::getReason() const
{
    std::lock_guard<std::mutex> lk(mutex_);
    return reason_;
}

int ShutdownManager::interruptedExitCode() const noexcept
{
    int sig = last_signal_.load();
    return sig != 0 ? 128 + sig : 1;
}

void ShutdownManager::reset() noexcept
{
    stopWatcher();

    shutdown_requested_.store(false);
    last_signal_.store(0);
    signal_flag_ = 0;
    signal_num_ = 0;
    signal_count_ = 0;

    {
        std::lock_guard<std::mutex> lk(mutex_);
        reason_.clear();
    }
    {
        std::lock_guard<std::recursive_mutex> lk(hooks_mutex_);
        hooks_.clear();
    }
}
