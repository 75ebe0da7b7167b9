#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "core/cache_store.hpp"
#include "core/camera_tree.hpp"
#include "core/dependency_graph.hpp"
#include "core/event_board.hpp"
#include "core/generators.hpp"

/**
 * @brief Which artifacts a run must deliver
 */
enum class RunTarget
{
    VIDEOS, // every shot video (and therefore every frame it needs)
    FRAMES  // every first and last frame, no videos
};

struct SchedulerOptions
{
    int max_concurrency = 8;
    RunTarget target = RunTarget::VIDEOS;
};

/**
 * @brief Result of one task in a run
 */
struct TaskOutcome
{
    TaskId task;
    TaskState state = TaskState::PENDING;
    bool from_cache = false;
    std::string error_kind;
    std::string error_message;
    std::chrono::milliseconds duration{0};

    bool succeeded() const { return state == TaskState::DONE; }
    bool ran() const { return state == TaskState::DONE || state == TaskState::FAILED; }
};

/**
 * @brief Artifacts available for one shot after a run, in shot order
 */
struct ShotOutput
{
    int shot_idx = 0;
    int cam_idx = 0;
    std::optional<fs::path> first_frame;
    std::optional<fs::path> last_frame;
    std::optional<fs::path> video;
};

struct RunReport
{
    std::vector<TaskId> requested;
    std::map<TaskId, TaskOutcome> outcomes;
    std::vector<ShotOutput> shot_outputs;

    size_t cached = 0;
    size_t generated = 0;
    size_t failed = 0;
    size_t not_run = 0;
    bool stopped = false;
    // Set when a disk failure aborted the run; fatal_error holds its message
    bool fatal = false;
    std::string fatal_error;
    std::chrono::milliseconds elapsed{0};

    /**
     * @brief True when every requested task is done
     */
    bool succeeded() const;

    std::vector<TaskOutcome> failures() const;
    std::string summary() const;
};

/**
 * @brief Dependency-aware parallel scheduler for frame and video tasks
 *
 * Every task whose prerequisites are all done is launched at once on a TBB
 * arena bounded by max_concurrency. No thread waits on a prerequisite:
 * a finishing task decrements its dependents' counters and launches those
 * that reach zero. Cached tasks complete without a generator call.
 *
 * A failed task fails all of its transitive dependents with
 * DependencyFailedError; independent branches keep running. A FatalIOError
 * aborts the run instead: nothing new is launched after it.
 *
 * When a run ends, signals of tasks that never ran are resolved as failed.
 */
class GenerationScheduler
{
public:
    using TaskObserver = std::function<void(const TaskId &, TaskState)>;

    GenerationScheduler(CacheStore &cache, GeneratorSuite generators, SchedulerOptions options = SchedulerOptions());

    GenerationScheduler(const GenerationScheduler &) = delete;
    GenerationScheduler &operator=(const GenerationScheduler &) = delete;

    /**
     * @brief Run every task needed for the requested artifacts
     * @throws ValidationError when the camera tree does not match the shots
     */
    RunReport run(const std::vector<Shot> &shots, const CameraTree &tree);

    /**
     * @brief Stop launching new tasks; in-flight tasks finish, the rest stay pending
     */
    void requestStop();
    bool stopRequested() const { return stop_requested_.load(); }

    // Called on every state change of a task, from the thread making the change
    void setObserver(TaskObserver observer) { observer_ = std::move(observer); }

    // Completion signals of the current (or last) run
    std::shared_ptr<EventBoard> eventBoard() const;

    const SchedulerOptions &options() const { return options_; }

private:
    struct RunContext;

    void launch(RunContext &ctx, const TaskId &task);
    void launchAll(RunContext &ctx, std::vector<TaskId> ready);
    void execute(RunContext &ctx, const TaskId &task);
    void complete(RunContext &ctx, TaskNode &node, std::chrono::milliseconds duration);
    void fail(RunContext &ctx, TaskNode &node, const std::string &error_kind, const std::string &message,
              std::chrono::milliseconds duration);
    void failDependents(RunContext &ctx, const TaskNode &failed);
    void abortRun(RunContext &ctx, const std::string &reason);
    void resolveUnfinished(RunContext &ctx);
    void recordOutcome(RunContext &ctx, const TaskOutcome &outcome);
    void notify(const TaskId &task, TaskState state);

    static std::vector<ArtifactKind> targetKinds(RunTarget target);
    std::vector<ShotOutput> collectOutputs(const std::vector<Shot> &shots, const CameraTree &tree,
                                           const RunReport &report) const;

    CacheStore &cache_;
    GeneratorSuite generators_;
    SchedulerOptions options_;
    TaskObserver observer_;

    std::atomic<bool> stop_requested_{false};
    mutable std::mutex board_mutex_;
    std::shared_ptr<EventBoard> board_;
};
