#include "core/pipeline_runner.hpp"
#include "core/shot_list_io.hpp"
#include "logging/logger.hpp"

PipelineRunner::PipelineRunner(const PipelineConfig &config, GeneratorSuite generators,
                               std::shared_ptr<const ShotMatcher> matcher)
    : config_(config), cache_(config.getWorkingDir()), generators_(std::move(generators)),
      tree_builder_(std::move(matcher))
{
    generators_.validate();
}

GeneratorSuite PipelineRunner::buildGenerators(const PipelineConfig &config, const GeneratorRegistry &registry)
{
    GeneratorSuite suite;
    suite.text = registry.createText(config.getTextGenerator().provider, config.getTextGenerator().settings);
    suite.image = registry.createImage(config.getImageGenerator().provider, config.getImageGenerator().settings);
    suite.video = registry.createVideo(config.getVideoGenerator().provider, config.getVideoGenerator().settings);
    suite.frame_grabber = registry.createFrameGrabber(config.getFrameGrabber().provider,
                                                      config.getFrameGrabber().settings);

    suite.text_guard = config.getTextGenerator().makeGuard();
    suite.image_guard = config.getImageGenerator().makeGuard();
    suite.video_guard = config.getVideoGenerator().makeGuard();
    suite.frame_guard = config.getFrameGrabber().makeGuard();

    Logger::info("Providers: text=" + config.getTextGenerator().provider +
                 ", image=" + config.getImageGenerator().provider +
                 ", video=" + config.getVideoGenerator().provider +
                 ", frame_grabber=" + config.getFrameGrabber().provider);
    return suite;
}

RunReport PipelineRunner::runFromFile(const std::string &shots_path, RunTarget target)
{
    return run(ShotListIO::loadShots(shots_path), target);
}

RunReport PipelineRunner::run(const std::vector<Shot> &shots, RunTarget target)
{
    if (shots.empty())
    {
        throw ValidationError("Shot list is empty");
    }

    const CameraTree tree = loadOrBuildCameraTree(shots);

    SchedulerOptions options;
    options.max_concurrency = config_.getMaxConcurrency();
    options.target = target;
    GenerationScheduler scheduler(cache_, generators_, options);

    {
        std::lock_guard<std::mutex> lock(scheduler_mutex_);
        active_scheduler_ = &scheduler;
        if (stop_requested_.load())
        {
            scheduler.requestStop();
        }
    }

    RunReport report;
    try
    {
        report = scheduler.run(shots, tree);
    }
    catch (...)
    {
        std::lock_guard<std::mutex> lock(scheduler_mutex_);
        active_scheduler_ = nullptr;
        throw;
    }
    {
        std::lock_guard<std::mutex> lock(scheduler_mutex_);
        active_scheduler_ = nullptr;
    }

    cache_.saveJson(CacheKey::runManifest(), buildManifest(report));
    Logger::info("Run manifest written to " + cache_.pathFor(CacheKey::runManifest()).string());
    return report;
}

CameraTree PipelineRunner::loadOrBuildCameraTree(const std::vector<Shot> &shots)
{
    const CacheKey key = CacheKey::cameraTree();
    if (cache_.exists(key))
    {
        try
        {
            CameraTree cached = CameraTree::fromJson(cache_.loadJson(key));
            cached.validate(shots);
            Logger::info("Reusing cached camera tree with " + std::to_string(cached.size()) + " cameras");
            return cached;
        }
        catch (const ValidationError &e)
        {
            Logger::warn("Cached camera tree no longer matches the shot list, rebuilding: " + std::string(e.what()));
            cache_.remove(key);
        }
    }

    CameraTree tree = tree_builder_.build(shots);
    cache_.saveJson(key, tree.toJson());
    return tree;
}

std::string PipelineRunner::describePlan(const std::vector<Shot> &shots)
{
    const CameraTree tree = loadOrBuildCameraTree(shots);
    auto graph = DependencyGraph::build(shots, tree);

    std::string plan;
    for (const auto &camera : tree.cameras())
    {
        plan += "camera " + std::to_string(camera.idx) + ": shots";
        for (int shot_idx : camera.active_shot_idxs)
        {
            plan += " " + std::to_string(shot_idx);
        }
        if (!camera.isRoot())
        {
            plan += " (parent camera " + std::to_string(*camera.parent_cam_idx) + ", shot " +
                    std::to_string(*camera.parent_shot_idx) + ", " + ArtifactKinds::getName(camera.parent_frame) +
                    (camera.is_parent_fully_covers_child.value_or(false) ? ", fully covered" : "") + ")";
        }
        plan += "\n";
    }

    for (const auto &id : graph->topologicalOrder())
    {
        const bool cached = cache_.exists(CacheKey::forTask(id));
        plan += (cached ? "[cached]  " : "[pending] ") + id.toString();
        const auto &prerequisites = graph->node(id).prerequisites;
        if (!prerequisites.empty())
        {
            plan += " <- ";
            for (size_t i = 0; i < prerequisites.size(); ++i)
            {
                plan += (i > 0 ? ", " : "") + prerequisites[i].toString();
            }
        }
        plan += "\n";
    }
    return plan;
}

nlohmann::json PipelineRunner::buildManifest(const RunReport &report) const
{
    auto artifactEntry = [&](int shot_idx, ArtifactKind kind, bool present) -> nlohmann::json
    {
        if (!present)
        {
            return nullptr;
        }
        const CacheKey key = CacheKey::forTask(TaskId{shot_idx, kind});
        nlohmann::json entry;
        entry["path"] = key.relativePath();
        entry["sha256"] = cache_.digest(key);
        return entry;
    };

    nlohmann::json shots = nlohmann::json::array();
    for (const auto &output : report.shot_outputs)
    {
        nlohmann::json shot;
        shot["idx"] = output.shot_idx;
        shot["camera"] = output.cam_idx;
        shot["first_frame"] = artifactEntry(output.shot_idx, ArtifactKind::FIRST_FRAME, output.first_frame.has_value());
        shot["last_frame"] = artifactEntry(output.shot_idx, ArtifactKind::LAST_FRAME, output.last_frame.has_value());
        shot["video"] = artifactEntry(output.shot_idx, ArtifactKind::SHOT_VIDEO, output.video.has_value());
        shots.push_back(shot);
    }

    nlohmann::json failed = nlohmann::json::array();
    for (const auto &failure : report.failures())
    {
        failed.push_back({{"shot", failure.task.shot_idx},
                          {"kind", ArtifactKinds::getName(failure.task.kind)},
                          {"error_kind", failure.error_kind},
                          {"message", failure.error_message}});
    }

    nlohmann::json manifest;
    manifest["succeeded"] = report.succeeded();
    manifest["stopped"] = report.stopped;
    if (report.fatal)
    {
        manifest["fatal_error"] = report.fatal_error;
    }
    manifest["counts"] = {{"cached", report.cached},
                          {"generated", report.generated},
                          {"failed", report.failed},
                          {"not_run", report.not_run}};
    manifest["shots"] = shots;
    manifest["failed_tasks"] = failed;
    return manifest;
}

void PipelineRunner::requestStop()
{
    stop_requested_.store(true);
    std::lock_guard<std::mutex> lock(scheduler_mutex_);
    if (active_scheduler_)
    {
        active_scheduler_->requestStop();
    }
}
