#include "core/dependency_graph.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <set>
#include <sstream>

bool TaskNode::transition(TaskState to)
{
    TaskState from = state.load();
    while (TaskStates::canTransition(from, to))
    {
        if (state.compare_exchange_weak(from, to))
        {
            return true;
        }
    }
    return false;
}

std::unique_ptr<DependencyGraph> DependencyGraph::build(const std::vector<Shot> &shots, const CameraTree &tree)
{
    tree.validate(shots);

    std::unique_ptr<DependencyGraph> graph(new DependencyGraph());
    std::map<int, const Shot *> shots_by_idx;
    for (const auto &shot : shots)
    {
        shots_by_idx[shot.idx] = &shot;
    }

    for (const auto &shot : shots)
    {
        int cam_idx = tree.cameraOf(shot.idx).idx;
        graph->addTask({shot.idx, ArtifactKind::FIRST_FRAME}, cam_idx);
        if (shot.requiresLastFrame())
        {
            graph->addTask({shot.idx, ArtifactKind::LAST_FRAME}, cam_idx);
        }
        graph->addTask({shot.idx, ArtifactKind::SHOT_VIDEO}, cam_idx);
    }

    for (const auto &camera : tree.cameras())
    {
        const TaskId leading_first{camera.leadingShotIdx(), ArtifactKind::FIRST_FRAME};

        if (camera.parent_shot_idx)
        {
            const Shot &parent_shot = *shots_by_idx.at(*camera.parent_shot_idx);
            ArtifactKind gate = parentGateKind(camera, parent_shot);
            if (gate != camera.parent_frame)
            {
                Logger::warn("Camera " + std::to_string(camera.idx) + " asks for the last frame of shot " +
                             std::to_string(parent_shot.idx) + " which has none; using its first frame");
            }
            graph->addEdge({parent_shot.idx, gate}, leading_first);
        }

        for (size_t i = 1; i < camera.active_shot_idxs.size(); ++i)
        {
            graph->addEdge(leading_first, {camera.active_shot_idxs[i], ArtifactKind::FIRST_FRAME});
        }
    }

    for (const auto &shot : shots)
    {
        const TaskId first{shot.idx, ArtifactKind::FIRST_FRAME};
        const TaskId video{shot.idx, ArtifactKind::SHOT_VIDEO};
        graph->addEdge(first, video);
        if (shot.requiresLastFrame())
        {
            const TaskId last{shot.idx, ArtifactKind::LAST_FRAME};
            graph->addEdge(first, last);
            graph->addEdge(last, video);
        }
    }

    graph->computeOrder();
    return graph;
}

ArtifactKind DependencyGraph::parentGateKind(const Camera &camera, const Shot &parent_shot)
{
    if (camera.parent_frame == ArtifactKind::LAST_FRAME && parent_shot.requiresLastFrame())
    {
        return ArtifactKind::LAST_FRAME;
    }
    return ArtifactKind::FIRST_FRAME;
}

TaskNode &DependencyGraph::node(const TaskId &id)
{
    auto it = nodes_.find(id);
    if (it == nodes_.end())
    {
        throw NotFoundError("Unknown task " + id.toString());
    }
    return *it->second;
}

const TaskNode &DependencyGraph::node(const TaskId &id) const
{
    auto it = nodes_.find(id);
    if (it == nodes_.end())
    {
        throw NotFoundError("Unknown task " + id.toString());
    }
    return *it->second;
}

bool DependencyGraph::contains(const TaskId &id) const
{
    return nodes_.find(id) != nodes_.end();
}

std::vector<TaskId> DependencyGraph::tasksOfKind(const std::vector<ArtifactKind> &kinds) const
{
    std::vector<TaskId> out;
    for (const auto &id : order_)
    {
        if (std::find(kinds.begin(), kinds.end(), id.kind) != kinds.end())
        {
            out.push_back(id);
        }
    }
    return out;
}

std::vector<TaskId> DependencyGraph::closure(const std::vector<TaskId> &targets) const
{
    std::set<TaskId> seen;
    std::vector<TaskId> stack(targets.begin(), targets.end());
    while (!stack.empty())
    {
        TaskId id = stack.back();
        stack.pop_back();
        if (!seen.insert(id).second)
        {
            continue;
        }
        for (const auto &prerequisite : node(id).prerequisites)
        {
            stack.push_back(prerequisite);
        }
    }

    // Keep topological order for callers
    std::vector<TaskId> out;
    for (const auto &id : order_)
    {
        if (seen.count(id))
        {
            out.push_back(id);
        }
    }
    return out;
}

std::vector<TaskId> DependencyGraph::transitiveDependents(const TaskId &id) const
{
    std::set<TaskId> seen;
    std::vector<TaskId> stack = node(id).dependents;
    while (!stack.empty())
    {
        TaskId current = stack.back();
        stack.pop_back();
        if (!seen.insert(current).second)
        {
            continue;
        }
        for (const auto &dependent : node(current).dependents)
        {
            stack.push_back(dependent);
        }
    }
    return std::vector<TaskId>(seen.begin(), seen.end());
}

std::string DependencyGraph::describe() const
{
    std::ostringstream out;
    for (const auto &id : order_)
    {
        const TaskNode &task = node(id);
        out << id.toString() << " [camera " << task.cam_idx << "]";
        if (!task.prerequisites.empty())
        {
            out << " <- ";
            for (size_t i = 0; i < task.prerequisites.size(); ++i)
            {
                if (i > 0)
                    out << ", ";
                out << task.prerequisites[i].toString();
            }
        }
        out << "\n";
    }
    return out.str();
}

void DependencyGraph::addTask(const TaskId &id, int cam_idx)
{
    auto task = std::make_unique<TaskNode>();
    task->id = id;
    task->cam_idx = cam_idx;
    if (!nodes_.emplace(id, std::move(task)).second)
    {
        throw ValidationError("Task " + id.toString() + " declared twice");
    }
}

void DependencyGraph::addEdge(const TaskId &prerequisite, const TaskId &dependent)
{
    TaskNode &from = node(prerequisite);
    TaskNode &to = node(dependent);
    if (std::find(to.prerequisites.begin(), to.prerequisites.end(), prerequisite) != to.prerequisites.end())
    {
        return;
    }
    to.prerequisites.push_back(prerequisite);
    from.dependents.push_back(dependent);
}

void DependencyGraph::computeOrder()
{
    std::map<TaskId, size_t> in_degree;
    std::set<TaskId> ready;
    for (const auto &entry : nodes_)
    {
        in_degree[entry.first] = entry.second->prerequisites.size();
        if (entry.second->prerequisites.empty())
        {
            ready.insert(entry.first);
        }
    }

    order_.clear();
    while (!ready.empty())
    {
        TaskId id = *ready.begin();
        ready.erase(ready.begin());
        order_.push_back(id);
        for (const auto &dependent : nodes_.at(id)->dependents)
        {
            if (--in_degree[dependent] == 0)
            {
                ready.insert(dependent);
            }
        }
    }

    if (order_.size() != nodes_.size())
    {
        throw ValidationError("Task graph contains a dependency cycle");
    }
}
