#include "core/shot_list_io.hpp"
#include "logging/logger.hpp"
#include <fstream>
#include <set>

using json = nlohmann::json;

namespace
{
    template <typename T>
    std::optional<T> optionalField(const json &j, const char *key)
    {
        auto it = j.find(key);
        if (it == j.end() || it->is_null())
        {
            return std::nullopt;
        }
        return it->get<T>();
    }

    std::string stringField(const json &j, const char *key)
    {
        auto it = j.find(key);
        if (it == j.end() || it->is_null())
        {
            return "";
        }
        return it->get<std::string>();
    }
}

Shot ShotListIO::shotFromJson(const json &j)
{
    if (!j.is_object())
    {
        throw ValidationError("Shot entry must be a JSON object");
    }
    if (!j.contains("idx") || !j["idx"].is_number_integer())
    {
        throw ValidationError("Shot entry is missing an integer 'idx'");
    }

    try
    {
        Shot shot;
        shot.idx = j["idx"].get<int>();
        shot.visual_desc = stringField(j, "visual_desc");
        shot.ff_desc = stringField(j, "ff_desc");
        shot.lf_desc = stringField(j, "lf_desc");
        shot.motion_desc = stringField(j, "motion_desc");
        shot.audio_desc = stringField(j, "audio_desc");
        shot.variation_type = VariationTypes::fromString(j.value("variation_type", std::string("small")));
        if (j.contains("reference_image_paths"))
        {
            shot.reference_image_paths = j["reference_image_paths"].get<std::vector<std::string>>();
        }

        shot.cam_idx = optionalField<int>(j, "cam_idx");
        shot.parent_cam_idx = optionalField<int>(j, "parent_cam_idx");
        shot.parent_shot_idx = optionalField<int>(j, "parent_shot_idx");
        if (auto frame = optionalField<std::string>(j, "parent_frame"))
        {
            shot.parent_frame = ArtifactKinds::fromString(*frame);
        }
        shot.is_parent_fully_covers_child = optionalField<bool>(j, "is_parent_fully_covers_child");
        shot.missing_info = optionalField<std::string>(j, "missing_info");
        return shot;
    }
    catch (const json::exception &e)
    {
        throw ValidationError("Malformed shot " + j["idx"].dump() + ": " + e.what());
    }
}

json ShotListIO::shotToJson(const Shot &shot)
{
    json j;
    j["idx"] = shot.idx;
    j["visual_desc"] = shot.visual_desc;
    j["ff_desc"] = shot.ff_desc;
    j["lf_desc"] = shot.lf_desc;
    j["motion_desc"] = shot.motion_desc;
    j["audio_desc"] = shot.audio_desc;
    j["variation_type"] = VariationTypes::getName(shot.variation_type);
    j["reference_image_paths"] = shot.reference_image_paths;
    if (shot.cam_idx)
        j["cam_idx"] = *shot.cam_idx;
    if (shot.parent_cam_idx)
        j["parent_cam_idx"] = *shot.parent_cam_idx;
    if (shot.parent_shot_idx)
        j["parent_shot_idx"] = *shot.parent_shot_idx;
    if (shot.parent_frame)
        j["parent_frame"] = ArtifactKinds::getName(*shot.parent_frame);
    if (shot.is_parent_fully_covers_child)
        j["is_parent_fully_covers_child"] = *shot.is_parent_fully_covers_child;
    if (shot.missing_info)
        j["missing_info"] = *shot.missing_info;
    return j;
}

std::vector<Shot> ShotListIO::parseShots(const json &doc)
{
    const json *entries = &doc;
    if (doc.is_object() && doc.contains("shots"))
    {
        entries = &doc["shots"];
    }
    if (!entries->is_array())
    {
        throw ValidationError("Shot list must be an array or an object with a 'shots' array");
    }

    std::vector<Shot> shots;
    shots.reserve(entries->size());
    std::set<int> seen;
    for (const auto &entry : *entries)
    {
        Shot shot = shotFromJson(entry);
        if (!seen.insert(shot.idx).second)
        {
            throw ValidationError("Duplicate shot idx " + std::to_string(shot.idx));
        }
        if (!shots.empty() && shot.idx < shots.back().idx)
        {
            throw ValidationError("Shot idx " + std::to_string(shot.idx) +
                                  " appears after shot " + std::to_string(shots.back().idx));
        }
        shots.push_back(std::move(shot));
    }
    return shots;
}

std::vector<Shot> ShotListIO::loadShots(const std::string &file_path)
{
    std::ifstream in(file_path);
    if (!in)
    {
        throw FatalIOError("Cannot open shot list: " + file_path);
    }

    json doc;
    try
    {
        in >> doc;
    }
    catch (const json::parse_error &e)
    {
        throw ValidationError("Shot list " + file_path + " is not valid JSON: " + e.what());
    }

    auto shots = parseShots(doc);
    Logger::info("Loaded " + std::to_string(shots.size()) + " shots from " + file_path);
    return shots;
}

json ShotListIO::cameraToJson(const Camera &camera)
{
    json j;
    j["idx"] = camera.idx;
    j["active_shot_idxs"] = camera.active_shot_idxs;
    j["parent_cam_idx"] = camera.parent_cam_idx ? json(*camera.parent_cam_idx) : json(nullptr);
    j["parent_shot_idx"] = camera.parent_shot_idx ? json(*camera.parent_shot_idx) : json(nullptr);
    j["parent_frame"] = ArtifactKinds::getName(camera.parent_frame);
    j["is_parent_fully_covers_child"] = camera.is_parent_fully_covers_child
                                            ? json(*camera.is_parent_fully_covers_child)
                                            : json(nullptr);
    j["missing_info"] = camera.missing_info ? json(*camera.missing_info) : json(nullptr);
    return j;
}

Camera ShotListIO::cameraFromJson(const json &j)
{
    try
    {
        Camera camera;
        camera.idx = j.at("idx").get<int>();
        camera.active_shot_idxs = j.at("active_shot_idxs").get<std::vector<int>>();
        if (camera.active_shot_idxs.empty())
        {
            throw ValidationError("Camera " + std::to_string(camera.idx) + " has no active shots");
        }
        camera.parent_cam_idx = optionalField<int>(j, "parent_cam_idx");
        camera.parent_shot_idx = optionalField<int>(j, "parent_shot_idx");
        if (auto frame = optionalField<std::string>(j, "parent_frame"))
        {
            camera.parent_frame = ArtifactKinds::fromString(*frame);
        }
        camera.is_parent_fully_covers_child = optionalField<bool>(j, "is_parent_fully_covers_child");
        camera.missing_info = optionalField<std::string>(j, "missing_info");
        return camera;
    }
    catch (const json::exception &e)
    {
        throw ValidationError(std::string("Malformed camera entry: ") + e.what());
    }
}

json ShotListIO::camerasToJson(const std::vector<Camera> &cameras)
{
    json doc = json::array();
    for (const auto &camera : cameras)
    {
        doc.push_back(cameraToJson(camera));
    }
    return doc;
}

std::vector<Camera> ShotListIO::camerasFromJson(const json &doc)
{
    if (!doc.is_array())
    {
        throw ValidationError("Camera tree must be a JSON array");
    }
    std::vector<Camera> cameras;
    cameras.reserve(doc.size());
    for (const auto &entry : doc)
    {
        cameras.push_back(cameraFromJson(entry));
    }
    return cameras;
}
