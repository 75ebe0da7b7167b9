#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "core/camera_tree.hpp"
#include "core/shot_types.hpp"

enum class TaskState
{
    PENDING,
    READY,
    RUNNING,
    DONE,
    FAILED
};

class TaskStates
{
public:
    static std::string getName(TaskState state)
    {
        switch (state)
        {
        case TaskState::PENDING:
            return "pending";
        case TaskState::READY:
            return "ready";
        case TaskState::RUNNING:
            return "running";
        case TaskState::DONE:
            return "done";
        case TaskState::FAILED:
            return "failed";
        default:
            return "unknown";
        }
    }

    static bool isTerminal(TaskState state)
    {
        return state == TaskState::DONE || state == TaskState::FAILED;
    }

    /**
     * @brief Legal transitions of the task state machine
     *
     * PENDING -> READY -> RUNNING -> DONE | FAILED, plus PENDING -> DONE for
     * cached tasks and PENDING -> FAILED when a prerequisite failed.
     */
    static bool canTransition(TaskState from, TaskState to)
    {
        switch (from)
        {
        case TaskState::PENDING:
            return to == TaskState::READY || to == TaskState::DONE || to == TaskState::FAILED;
        case TaskState::READY:
            return to == TaskState::RUNNING || to == TaskState::FAILED;
        case TaskState::RUNNING:
            return to == TaskState::DONE || to == TaskState::FAILED;
        default:
            return false;
        }
    }
};

/**
 * @brief One task of the run with its edges and mutable run state
 */
struct TaskNode
{
    TaskId id;
    int cam_idx = 0;
    std::vector<TaskId> prerequisites;
    std::vector<TaskId> dependents;

    std::atomic<TaskState> state{TaskState::PENDING};
    std::atomic<int> unmet_prerequisites{0};
    std::atomic<bool> dependency_failed{false};

    /**
     * @brief Atomically move to `to` if the state machine allows it
     * @return false when another thread moved the node first or the move is illegal
     */
    bool transition(TaskState to);
};

/**
 * @brief Typed task graph for one run, derived from shots and the camera tree
 *
 * Edges:
 *  - first frame of a child camera's leading shot <- the parent shot's frame
 *    (its last frame when the camera asks for it and the parent shot has one)
 *  - first frame of a camera's later shots <- first frame of its leading shot
 *  - last frame <- first frame of the same shot
 *  - shot video <- first frame (and last frame when required)
 */
class DependencyGraph
{
public:
    /**
     * @throws ValidationError when the tree does not match the shots or the graph has a cycle
     */
    static std::unique_ptr<DependencyGraph> build(const std::vector<Shot> &shots, const CameraTree &tree);

    /**
     * @brief Frame of the parent shot that gates a child camera's leading first frame
     *
     * The camera's parent_frame, except that a parent shot without a last
     * frame always gates on its first frame.
     */
    static ArtifactKind parentGateKind(const Camera &camera, const Shot &parent_shot);

    TaskNode &node(const TaskId &id);
    const TaskNode &node(const TaskId &id) const;
    bool contains(const TaskId &id) const;

    // All tasks in topological order (prerequisites first, ties by shot then kind)
    const std::vector<TaskId> &topologicalOrder() const { return order_; }

    // Tasks of the given kinds
    std::vector<TaskId> tasksOfKind(const std::vector<ArtifactKind> &kinds) const;

    // The given tasks plus everything they transitively depend on
    std::vector<TaskId> closure(const std::vector<TaskId> &targets) const;

    // Every task transitively depending on the given one
    std::vector<TaskId> transitiveDependents(const TaskId &id) const;

    size_t size() const { return nodes_.size(); }

    // Human-readable listing used by --plan
    std::string describe() const;

private:
    DependencyGraph() = default;

    void addTask(const TaskId &id, int cam_idx);
    void addEdge(const TaskId &prerequisite, const TaskId &dependent);
    void computeOrder();

    std::map<TaskId, std::unique_ptr<TaskNode>> nodes_;
    std::vector<TaskId> order_;
};
