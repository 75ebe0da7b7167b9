#include "core/shot_task_executor.hpp"
#include "core/dependency_graph.hpp"
#include "logging/logger.hpp"

ShotTaskExecutor::ShotTaskExecutor(CacheStore &cache, const GeneratorSuite &generators,
                                   const std::vector<Shot> &shots, const CameraTree &tree)
    : cache_(cache), generators_(generators), tree_(tree)
{
    for (const auto &shot : shots)
    {
        shots_[shot.idx] = shot;
    }
}

void ShotTaskExecutor::produce(const TaskId &task)
{
    const Shot &shot = shotAt(task.shot_idx);
    switch (task.kind)
    {
    case ArtifactKind::FIRST_FRAME:
        produceFirstFrame(shot);
        break;
    case ArtifactKind::LAST_FRAME:
        produceLastFrame(shot);
        break;
    case ArtifactKind::SHOT_VIDEO:
        produceVideo(shot);
        break;
    }
}

void ShotTaskExecutor::produceFirstFrame(const Shot &shot)
{
    const Camera &camera = tree_.cameraOf(shot.idx);
    if (camera.leadingShotIdx() != shot.idx)
    {
        // Later shots of a camera reuse the leading shot's first frame as composition reference
        const Shot &leading = shotAt(camera.leadingShotIdx());
        std::vector<ReferenceImage> references = shotReferences(shot);
        references.insert(references.begin(),
                          ReferenceImage{pathOf(CacheKey::frame(leading.idx, ArtifactKind::FIRST_FRAME)),
                                         "Same camera, earlier shot: " + leading.ff_desc});
        renderFrame(shot, ArtifactKind::FIRST_FRAME, references);
        return;
    }

    if (camera.isRoot())
    {
        renderFrame(shot, ArtifactKind::FIRST_FRAME, shotReferences(shot));
        return;
    }

    produceCameraEntry(shot, camera);
}

void ShotTaskExecutor::produceCameraEntry(const Shot &shot, const Camera &camera)
{
    const int parent_cam_idx = *camera.parent_cam_idx;
    const Shot &parent_shot = shotAt(*camera.parent_shot_idx);
    const ArtifactKind gate = DependencyGraph::parentGateKind(camera, parent_shot);
    const std::string parent_frame_path = pathOf(CacheKey::frame(parent_shot.idx, gate));

    const CacheKey transition_key = CacheKey::transitionVideo(parent_cam_idx, camera.idx);
    if (!cache_.exists(transition_key))
    {
        VideoRequest request;
        request.prompt = "Camera move from the established view to a new angle.\nFrom: " + parent_shot.visual_desc +
                         "\nTo: " + shot.visual_desc;
        request.reference_image_paths.push_back(parent_frame_path);
        GeneratedArtifact transition = generators_.video_guard->call(
            "transition camera " + std::to_string(parent_cam_idx) + " -> " + std::to_string(camera.idx), [&]()
            {
                GeneratedArtifact out = generators_.video->generateVideo(request);
                if (out.empty())
                {
                    throw ValidationError("Video generator returned an empty transition video");
                }
                return out; });
        cache_.save(transition_key, transition);
        Logger::info("Transition video ready for camera " + std::to_string(parent_cam_idx) + " -> " +
                     std::to_string(camera.idx));
    }

    const CacheKey new_camera_key = CacheKey::newCameraImage(parent_cam_idx, camera.idx);
    if (!cache_.exists(new_camera_key))
    {
        const fs::path transition_path = cache_.pathFor(transition_key);
        GeneratedArtifact frame = generators_.frame_guard->call(
            "grab new camera frame " + std::to_string(camera.idx), [&]()
            {
                GeneratedArtifact out = generators_.frame_grabber->grabLastFrame(transition_path);
                if (out.empty())
                {
                    throw ValidationError("Frame grabber returned an empty image");
                }
                return out; });
        cache_.save(new_camera_key, frame);
    }

    if (camera.is_parent_fully_covers_child.value_or(false))
    {
        cache_.copy(new_camera_key, CacheKey::frame(shot.idx, ArtifactKind::FIRST_FRAME));
        Logger::info("Shot " + std::to_string(shot.idx) + " first frame taken from the camera transition of camera " +
                     std::to_string(camera.idx));
        return;
    }

    std::string description =
        "View from the new camera position. Composition and background are correct, but some content "
        "may be absent or wrong.";
    if (camera.missing_info && !camera.missing_info->empty())
    {
        description += " Elements to correct: " + *camera.missing_info;
    }

    std::vector<ReferenceImage> references = shotReferences(shot);
    references.insert(references.begin(), ReferenceImage{pathOf(new_camera_key), description});
    renderFrame(shot, ArtifactKind::FIRST_FRAME, references);
}

void ShotTaskExecutor::produceLastFrame(const Shot &shot)
{
    std::vector<ReferenceImage> references = shotReferences(shot);
    references.insert(references.begin(),
                      ReferenceImage{pathOf(CacheKey::frame(shot.idx, ArtifactKind::FIRST_FRAME)),
                                     "First frame of this shot: " + shot.ff_desc});
    renderFrame(shot, ArtifactKind::LAST_FRAME, references);
}

void ShotTaskExecutor::produceVideo(const Shot &shot)
{
    VideoRequest request;
    request.prompt = shot.motion_desc;
    if (!shot.audio_desc.empty())
    {
        request.prompt += "\n" + shot.audio_desc;
    }
    request.reference_image_paths.push_back(pathOf(CacheKey::frame(shot.idx, ArtifactKind::FIRST_FRAME)));
    if (shot.requiresLastFrame())
    {
        request.reference_image_paths.push_back(pathOf(CacheKey::frame(shot.idx, ArtifactKind::LAST_FRAME)));
    }

    GeneratedArtifact video = generators_.video_guard->call(
        "shot " + std::to_string(shot.idx) + " video", [&]()
        {
            GeneratedArtifact out = generators_.video->generateVideo(request);
            if (out.empty())
            {
                throw ValidationError("Video generator returned an empty video");
            }
            return out; });
    cache_.save(CacheKey::shotVideo(shot.idx), video);
}

void ShotTaskExecutor::renderFrame(const Shot &shot, ArtifactKind kind, const std::vector<ReferenceImage> &references)
{
    const nlohmann::json selection = selectorOutput(shot, kind, references);

    ImageRequest request;
    std::string prefix;
    int image_number = 0;
    for (const auto &pair : selection["reference_image_path_and_text_pairs"])
    {
        request.reference_image_paths.push_back(pair[0].get<std::string>());
        prefix += "Image " + std::to_string(image_number++) + ": " + pair[1].get<std::string>() + "\n";
    }
    request.prompt = prefix.empty() ? selection["text_prompt"].get<std::string>()
                                    : prefix + "\n" + selection["text_prompt"].get<std::string>();

    const std::string operation = "shot " + std::to_string(shot.idx) + " " + ArtifactKinds::getName(kind);
    GeneratedArtifact image = generators_.image_guard->call(operation, [&]()
                                                            {
        GeneratedArtifact out = generators_.image->generateImage(request);
        if (out.empty())
        {
            throw ValidationError("Image generator returned an empty image for " + operation);
        }
        return out; });
    cache_.save(CacheKey::frame(shot.idx, kind), image);
}

nlohmann::json ShotTaskExecutor::selectorOutput(const Shot &shot, ArtifactKind kind,
                                                const std::vector<ReferenceImage> &references)
{
    const CacheKey key = CacheKey::selectorOutput(shot.idx, kind);
    if (cache_.exists(key))
    {
        try
        {
            nlohmann::json cached = cache_.loadJson(key);
            validateSelectorOutput(cached);
            Logger::debug("Reusing selector output " + key.relativePath());
            return cached;
        }
        catch (const ValidationError &e)
        {
            Logger::warn("Discarding stale selector output " + key.relativePath() + ": " + e.what());
            cache_.remove(key);
        }
    }

    FramePromptRequest request;
    request.task = TaskId{shot.idx, kind};
    request.frame_desc = kind == ArtifactKind::LAST_FRAME ? shot.lf_desc : shot.ff_desc;
    request.available_references = references;

    nlohmann::json selection = generators_.text_guard->call(
        "select references for shot " + std::to_string(shot.idx) + " " + ArtifactKinds::getName(kind), [&]()
        {
            nlohmann::json out = generators_.text->selectReferencesAndPrompt(request);
            validateSelectorOutput(out);
            return out; });
    cache_.saveJson(key, selection);
    return selection;
}

void ShotTaskExecutor::validateSelectorOutput(const nlohmann::json &doc)
{
    if (!doc.is_object())
    {
        throw ValidationError("Selector output is not a JSON object");
    }
    if (!doc.contains("text_prompt") || !doc["text_prompt"].is_string())
    {
        throw ValidationError("Selector output has no text_prompt");
    }
    if (!doc.contains("reference_image_path_and_text_pairs"))
    {
        throw ValidationError("Selector output has no reference_image_path_and_text_pairs");
    }
    const auto &pairs = doc["reference_image_path_and_text_pairs"];
    if (!pairs.is_array())
    {
        throw ValidationError("reference_image_path_and_text_pairs must be an array");
    }
    for (const auto &pair : pairs)
    {
        if (!pair.is_array() || pair.size() != 2 || !pair[0].is_string() || !pair[1].is_string())
        {
            throw ValidationError("Each reference pair must be [path, description]");
        }
    }
}

std::vector<ReferenceImage> ShotTaskExecutor::shotReferences(const Shot &shot) const
{
    std::vector<ReferenceImage> references;
    for (const auto &path : shot.reference_image_paths)
    {
        references.push_back(ReferenceImage{path, "Reference image " + fs::path(path).filename().string()});
    }
    return references;
}

const Shot &ShotTaskExecutor::shotAt(int shot_idx) const
{
    auto it = shots_.find(shot_idx);
    if (it == shots_.end())
    {
        throw NotFoundError("Unknown shot " + std::to_string(shot_idx));
    }
    return it->second;
}

std::string ShotTaskExecutor::pathOf(const CacheKey &key) const
{
    return cache_.pathFor(key).string();
}
