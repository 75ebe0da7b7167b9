#pragma once

#include <atomic>
#include <condition_variable>
#include <csignal>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>

/**
 * @brief Process-wide interruption of a generation run
 *
 * The first SIGINT/SIGTERM only sets a flag; a watcher thread turns the flag
 * into a shutdown request and runs the registered stop hooks (the scheduler's
 * requestStop()). A second signal restores the default action and re-raises,
 * abandoning in-flight tasks. Work already written to the cache stays there,
 * so the next run resumes from it.
 */
class ShutdownManager
{
public:
    using StopHook = std::function<void()>;

    static ShutdownManager &getInstance();

    // Install SIGINT/SIGTERM handlers and start the watcher thread
    void installSignalHandlers();

    // Safe from any thread, not from a signal handler
    void requestShutdown(const std::string &reason, int signal_number = 0) noexcept;

    bool isShutdownRequested() const noexcept { return shutdown_requested_.load(); }

    // Block until shutdown has been requested
    void waitForShutdown();

    /**
     * @brief Register a hook run once when shutdown is requested
     *
     * A hook registered after the request runs immediately.
     * @return id for removeStopHook()
     */
    int addStopHook(StopHook hook);

    // Waits for hooks that are running on another thread to return
    void removeStopHook(int id);

    int getSignalNumber() const noexcept { return last_signal_.load(); }
    std::string getReason() const;

    // Exit code convention for an interrupted run (128 + signal)
    int interruptedExitCode() const noexcept;

    // Reset state for testing purposes
    void reset() noexcept;

private:
    ShutdownManager() = default;
    ~ShutdownManager();
    ShutdownManager(const ShutdownManager &) = delete;
    ShutdownManager &operator=(const ShutdownManager &) = delete;

    // Async-signal-safe handler: flags on the first signal, default action on the next
    static void handleSignal(int sig) noexcept;

    void startWatcher();
    void stopWatcher();
    void runHooks() noexcept;

    std::atomic<bool> shutdown_requested_{false};
    std::atomic<int> last_signal_{0};
    std::string reason_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;

    // Held while hooks run; recursive so a hook may add or remove hooks
    std::recursive_mutex hooks_mutex_;
    std::map<int, StopHook> hooks_;
    int next_hook_id_ = 1;

    std::thread watcher_;
    std::atomic<bool> watcher_running_{false};

    static volatile sig_atomic_t signal_flag_;
    static volatile sig_atomic_t signal_num_;
    static volatile sig_atomic_t signal_count_;
};
