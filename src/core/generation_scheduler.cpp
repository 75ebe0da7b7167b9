#include "core/generation_scheduler.hpp"
#include "core/generation_errors.hpp"
#include "core/shot_task_executor.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <set>
#include <sstream>
#include <tbb/concurrent_priority_queue.h>
#include <tbb/task_arena.h>
#include <tbb/task_group.h>

namespace
{
    struct ReadyTask
    {
        size_t priority = 0;
        TaskId task;
    };

    // Larger downstream fan-out first, then earlier shots
    struct ReadyOrder
    {
        bool operator()(const ReadyTask &a, const ReadyTask &b) const
        {
            if (a.priority != b.priority)
            {
                return a.priority < b.priority;
            }
            return b.task < a.task;
        }
    };

    std::chrono::milliseconds elapsedSince(std::chrono::steady_clock::time_point start)
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    }
}

struct GenerationScheduler::RunContext
{
    std::unique_ptr<DependencyGraph> graph;
    std::shared_ptr<EventBoard> board;
    std::unique_ptr<ShotTaskExecutor> executor;
    std::set<TaskId> scheduled;
    std::map<TaskId, size_t> priority;

    tbb::concurrent_priority_queue<ReadyTask, ReadyOrder> ready;
    tbb::task_group group;

    std::mutex outcomes_mutex;
    std::map<TaskId, TaskOutcome> outcomes;
    bool fatal = false;
    std::string fatal_error;
};

bool RunReport::succeeded() const
{
    for (const auto &task : requested)
    {
        auto it = outcomes.find(task);
        if (it == outcomes.end() || !it->second.succeeded())
        {
            return false;
        }
    }
    return true;
}

std::vector<TaskOutcome> RunReport::failures() const
{
    std::vector<TaskOutcome> out;
    for (const auto &entry : outcomes)
    {
        if (entry.second.state == TaskState::FAILED)
        {
            out.push_back(entry.second);
        }
    }
    return out;
}

std::string RunReport::summary() const
{
    std::ostringstream out;
    out << outcomes.size() << " tasks: " << cached << " cached, " << generated << " generated, "
        << failed << " failed, " << not_run << " not run";
    if (stopped)
    {
        out << " (stopped)";
    }
    out << " in " << elapsed.count() << " ms";
    return out.str();
}

GenerationScheduler::GenerationScheduler(CacheStore &cache, GeneratorSuite generators, SchedulerOptions options)
    : cache_(cache), generators_(std::move(generators)), options_(options)
{
    if (options_.max_concurrency < 1)
    {
        throw ConfigError("max_concurrency must be at least 1, got " + std::to_string(options_.max_concurrency));
    }
    generators_.validate();
}

void GenerationScheduler::requestStop()
{
    if (!stop_requested_.exchange(true))
    {
        Logger::warn("Stop requested: no new tasks will be launched");
    }
}

std::shared_ptr<EventBoard> GenerationScheduler::eventBoard() const
{
    std::lock_guard<std::mutex> lock(board_mutex_);
    return board_;
}

RunReport GenerationScheduler::run(const std::vector<Shot> &shots, const CameraTree &tree)
{
    const auto started = std::chrono::steady_clock::now();

    RunContext ctx;
    ctx.graph = DependencyGraph::build(shots, tree);
    ctx.board = std::make_shared<EventBoard>();
    {
        std::lock_guard<std::mutex> lock(board_mutex_);
        board_ = ctx.board;
    }
    ctx.executor = std::make_unique<ShotTaskExecutor>(cache_, generators_, shots, tree);

    RunReport report;
    report.requested = ctx.graph->tasksOfKind(targetKinds(options_.target));
    const std::vector<TaskId> scheduled = ctx.graph->closure(report.requested);
    ctx.scheduled.insert(scheduled.begin(), scheduled.end());

    Logger::info("Scheduling " + std::to_string(scheduled.size()) + " of " + std::to_string(ctx.graph->size()) +
                 " tasks for " + std::to_string(report.requested.size()) + " requested artifacts, max concurrency " +
                 std::to_string(options_.max_concurrency));

    // Cached tasks complete before anything launches
    std::vector<TaskId> broken;
    for (const auto &id : scheduled)
    {
        auto signal = ctx.board->signalFor(id);
        TaskNode &node = ctx.graph->node(id);
        try
        {
            if (!cache_.exists(CacheKey::forTask(id)))
            {
                continue;
            }
        }
        catch (const std::exception &e)
        {
            if (dynamic_cast<const FatalIOError *>(&e))
            {
                abortRun(ctx, e.what());
            }
            node.transition(TaskState::FAILED);
            signal->fail(e.what());
            recordOutcome(ctx, TaskOutcome{id, TaskState::FAILED, false, errorKindName(e), e.what(), {}});
            Logger::error("Cannot inspect cache for " + id.toString() + ": " + e.what());
            notify(id, TaskState::FAILED);
            broken.push_back(id);
            continue;
        }

        node.transition(TaskState::DONE);
        signal->set();
        recordOutcome(ctx, TaskOutcome{id, TaskState::DONE, true, "", "", {}});
        Logger::info("Cache hit: " + id.toString());
        notify(id, TaskState::DONE);
    }

    for (const auto &id : broken)
    {
        failDependents(ctx, ctx.graph->node(id));
    }

    std::vector<TaskId> ready;
    for (const auto &id : scheduled)
    {
        TaskNode &node = ctx.graph->node(id);
        if (node.state.load() != TaskState::PENDING)
        {
            continue;
        }

        int unmet = 0;
        for (const auto &prerequisite : node.prerequisites)
        {
            if (ctx.graph->node(prerequisite).state.load() != TaskState::DONE)
            {
                ++unmet;
            }
        }
        node.unmet_prerequisites.store(unmet);

        size_t fan_out = 0;
        for (const auto &dependent : ctx.graph->transitiveDependents(id))
        {
            fan_out += ctx.scheduled.count(dependent);
        }
        ctx.priority[id] = fan_out;

        if (unmet == 0)
        {
            ready.push_back(id);
        }
    }

    tbb::task_arena arena(options_.max_concurrency);
    arena.execute([&]()
                  {
        launchAll(ctx, ready);
        ctx.group.wait(); });

    resolveUnfinished(ctx);

    for (const auto &id : scheduled)
    {
        auto it = ctx.outcomes.find(id);
        if (it == ctx.outcomes.end())
        {
            TaskOutcome outcome;
            outcome.task = id;
            outcome.state = ctx.graph->node(id).state.load();
            it = ctx.outcomes.emplace(id, outcome).first;
        }

        const TaskOutcome &outcome = it->second;
        if (outcome.state == TaskState::DONE)
        {
            if (outcome.from_cache)
                ++report.cached;
            else
                ++report.generated;
        }
        else if (outcome.state == TaskState::FAILED)
        {
            ++report.failed;
        }
        else
        {
            ++report.not_run;
        }
    }

    report.outcomes = std::move(ctx.outcomes);
    report.stopped = stop_requested_.load();
    report.fatal = ctx.fatal;
    report.fatal_error = ctx.fatal_error;
    report.elapsed = elapsedSince(started);
    report.shot_outputs = collectOutputs(shots, tree, report);

    for (const auto &failure : report.failures())
    {
        Logger::error("Task " + failure.task.toString() + " failed [" + failure.error_kind + "]: " +
                      failure.error_message);
    }
    if (report.succeeded())
    {
        Logger::info("Run complete: " + report.summary());
    }
    else
    {
        Logger::error("Run failed: " + report.summary());
    }
    return report;
}

void GenerationScheduler::launchAll(RunContext &ctx, std::vector<TaskId> ready)
{
    for (const auto &id : ready)
    {
        launch(ctx, id);
    }
}

void GenerationScheduler::launch(RunContext &ctx, const TaskId &task)
{
    if (stop_requested_.load())
    {
        return;
    }

    TaskNode &node = ctx.graph->node(task);
    if (!node.transition(TaskState::READY))
    {
        return;
    }
    notify(task, TaskState::READY);

    // One queued entry per spawned body; each body takes the most urgent ready task
    ctx.ready.push(ReadyTask{ctx.priority.at(task), task});
    ctx.group.run([this, &ctx]()
                  {
        ReadyTask next;
        if (ctx.ready.try_pop(next))
        {
            execute(ctx, next.task);
        } });
}

void GenerationScheduler::execute(RunContext &ctx, const TaskId &task)
{
    if (stop_requested_.load())
    {
        return;
    }

    TaskNode &node = ctx.graph->node(task);
    if (!node.transition(TaskState::RUNNING))
    {
        return;
    }
    notify(task, TaskState::RUNNING);
    Logger::info("Starting " + task.toString());

    const auto started = std::chrono::steady_clock::now();
    try
    {
        ctx.executor->produce(task);
    }
    catch (const FatalIOError &e)
    {
        abortRun(ctx, e.what());
        fail(ctx, node, errorKindName(e), e.what(), elapsedSince(started));
        return;
    }
    catch (const std::exception &e)
    {
        fail(ctx, node, errorKindName(e), e.what(), elapsedSince(started));
        return;
    }
    catch (...)
    {
        fail(ctx, node, "UnclassifiedError", "non-standard exception", elapsedSince(started));
        return;
    }
    complete(ctx, node, elapsedSince(started));
}

void GenerationScheduler::complete(RunContext &ctx, TaskNode &node, std::chrono::milliseconds duration)
{
    node.transition(TaskState::DONE);
    ctx.board->signalFor(node.id)->set();
    recordOutcome(ctx, TaskOutcome{node.id, TaskState::DONE, false, "", "", duration});
    Logger::info("Finished " + node.id.toString() + " in " + std::to_string(duration.count()) + " ms");
    notify(node.id, TaskState::DONE);

    std::vector<TaskId> released;
    for (const auto &dependent : node.dependents)
    {
        if (!ctx.scheduled.count(dependent))
        {
            continue;
        }
        if (ctx.graph->node(dependent).unmet_prerequisites.fetch_sub(1) == 1)
        {
            released.push_back(dependent);
        }
    }
    launchAll(ctx, released);
}

void GenerationScheduler::fail(RunContext &ctx, TaskNode &node, const std::string &error_kind,
                               const std::string &message, std::chrono::milliseconds duration)
{
    node.transition(TaskState::FAILED);
    ctx.board->signalFor(node.id)->fail(message);
    recordOutcome(ctx, TaskOutcome{node.id, TaskState::FAILED, false, error_kind, message, duration});
    Logger::error("Task " + node.id.toString() + " failed [" + error_kind + "]: " + message);
    notify(node.id, TaskState::FAILED);

    failDependents(ctx, node);
}

void GenerationScheduler::failDependents(RunContext &ctx, const TaskNode &failed)
{
    for (const auto &dependent : failed.dependents)
    {
        if (!ctx.scheduled.count(dependent))
        {
            continue;
        }

        TaskNode &node = ctx.graph->node(dependent);
        if (!node.transition(TaskState::FAILED))
        {
            continue; // cached, or already failed through another prerequisite
        }
        node.dependency_failed.store(true);

        const DependencyFailedError error("prerequisite " + failed.id.toString() + " failed");
        ctx.board->signalFor(dependent)->fail(error.what());
        recordOutcome(ctx, TaskOutcome{dependent, TaskState::FAILED, false, errorKindName(error), error.what(), {}});
        Logger::warn("Skipping " + dependent.toString() + ": " + error.what());
        notify(dependent, TaskState::FAILED);

        failDependents(ctx, node);
    }
}

void GenerationScheduler::abortRun(RunContext &ctx, const std::string &reason)
{
    {
        std::lock_guard<std::mutex> lock(ctx.outcomes_mutex);
        if (ctx.fatal)
        {
            return;
        }
        ctx.fatal = true;
        ctx.fatal_error = reason;
    }
    Logger::error("Aborting run after disk failure: " + reason);
    requestStop();
}

void GenerationScheduler::resolveUnfinished(RunContext &ctx)
{
    const std::string reason = !ctx.fatal ? "not run: stop requested"
                                      : "not run: run aborted after " + ctx.fatal_error;
    for (const auto &id : ctx.scheduled)
    {
        if (ctx.board->signalFor(id)->fail(reason))
        {
            Logger::debug("Released waiters of " + id.toString() + ": " + reason);
        }
    }
}

void GenerationScheduler::recordOutcome(RunContext &ctx, const TaskOutcome &outcome)
{
    std::lock_guard<std::mutex> lock(ctx.outcomes_mutex);
    ctx.outcomes[outcome.task] = outcome;
}

void GenerationScheduler::notify(const TaskId &task, TaskState state)
{
    if (observer_)
    {
        observer_(task, state);
    }
}

std::vector<ArtifactKind> GenerationScheduler::targetKinds(RunTarget target)
{
    if (target == RunTarget::FRAMES)
    {
        return {ArtifactKind::FIRST_FRAME, ArtifactKind::LAST_FRAME};
    }
    return {ArtifactKind::SHOT_VIDEO};
}

std::vector<ShotOutput> GenerationScheduler::collectOutputs(const std::vector<Shot> &shots, const CameraTree &tree,
                                                            const RunReport &report) const
{
    auto doneAt = [&](int shot_idx, ArtifactKind kind) -> std::optional<fs::path>
    {
        auto it = report.outcomes.find(TaskId{shot_idx, kind});
        if (it == report.outcomes.end() || !it->second.succeeded())
        {
            return std::nullopt;
        }
        return cache_.pathFor(CacheKey::forTask(it->first));
    };

    std::vector<ShotOutput> outputs;
    for (const auto &shot : shots)
    {
        ShotOutput output;
        output.shot_idx = shot.idx;
        output.cam_idx = tree.cameraOf(shot.idx).idx;
        output.first_frame = doneAt(shot.idx, ArtifactKind::FIRST_FRAME);
        output.last_frame = doneAt(shot.idx, ArtifactKind::LAST_FRAME);
        output.video = doneAt(shot.idx, ArtifactKind::SHOT_VIDEO);
        outputs.push_back(output);
    }
    return outputs;
}
