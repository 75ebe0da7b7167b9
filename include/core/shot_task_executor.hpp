#pragma once

#include <map>
#include <string>
#include <vector>
#include "core/cache_store.hpp"
#include "core/camera_tree.hpp"
#include "core/generators.hpp"

/**
 * @brief Produces the artifact of one task and persists it in the cache
 *
 * Called by the scheduler once every prerequisite of the task is done, so the
 * prerequisite artifacts can be read from the cache as references.
 * Intermediate results (selector output, camera transitions) are cached under
 * their own keys and reused on a later attempt or run.
 */
class ShotTaskExecutor
{
public:
    ShotTaskExecutor(CacheStore &cache, const GeneratorSuite &generators,
                     const std::vector<Shot> &shots, const CameraTree &tree);

    /**
     * @brief Generate and save the artifact for `task`
     * @throws whatever the guarded generator call or the cache throws
     */
    void produce(const TaskId &task);

private:
    void produceFirstFrame(const Shot &shot);
    void produceLastFrame(const Shot &shot);
    void produceVideo(const Shot &shot);

    // Transition from the parent camera, then re-render or copy into the first frame
    void produceCameraEntry(const Shot &shot, const Camera &camera);

    // Selector step (cached JSON) followed by the image generator
    void renderFrame(const Shot &shot, ArtifactKind kind, const std::vector<ReferenceImage> &references);

    nlohmann::json selectorOutput(const Shot &shot, ArtifactKind kind, const std::vector<ReferenceImage> &references);

    std::vector<ReferenceImage> shotReferences(const Shot &shot) const;
    const Shot &shotAt(int shot_idx) const;
    std::string pathOf(const CacheKey &key) const;

    static void validateSelectorOutput(const nlohmann::json &doc);

    CacheStore &cache_;
    const GeneratorSuite &generators_;
    const CameraTree &tree_;
    std::map<int, Shot> shots_;
};
