#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "core/cache_store.hpp"
#include "core/camera_tree.hpp"
#include "core/generation_scheduler.hpp"
#include "core/generator_registry.hpp"
#include "core/pipeline_config.hpp"

/**
 * @brief One generation run end to end
 *
 * Loads or builds the camera tree (cached as camera_tree.json and validated
 * against the shot list before reuse), runs the scheduler and writes
 * run_manifest.json describing every shot's artifacts.
 */
class PipelineRunner
{
public:
    PipelineRunner(const PipelineConfig &config, GeneratorSuite generators,
                   std::shared_ptr<const ShotMatcher> matcher = nullptr);

    /**
     * @brief Resolve every provider named in the configuration and attach its guard
     * @throws ConfigError for unknown providers
     */
    static GeneratorSuite buildGenerators(const PipelineConfig &config, const GeneratorRegistry &registry);

    RunReport run(const std::vector<Shot> &shots, RunTarget target = RunTarget::VIDEOS);
    RunReport runFromFile(const std::string &shots_path, RunTarget target = RunTarget::VIDEOS);

    /**
     * @brief Cached tree when it still matches the shots, otherwise a fresh one (saved)
     */
    CameraTree loadOrBuildCameraTree(const std::vector<Shot> &shots);

    // Task listing for the shots without running anything
    std::string describePlan(const std::vector<Shot> &shots);

    nlohmann::json buildManifest(const RunReport &report) const;

    // Forwarded to the active scheduler; safe from any thread
    void requestStop();

    CacheStore &cache() { return cache_; }

private:
    const PipelineConfig config_;
    CacheStore cache_;
    GeneratorSuite generators_;
    CameraTreeBuilder tree_builder_;
    std::atomic<bool> stop_requested_{false};

    std::mutex scheduler_mutex_;
    GenerationScheduler *active_scheduler_ = nullptr;
};
