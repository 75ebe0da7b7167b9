#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "core/shot_types.hpp"

/**
 * @brief JSON conversion for shots and cameras
 *
 * Shot lists come from the upstream script stages either as a bare array or
 * as an object with a "shots" array. Malformed documents raise
 * ValidationError; unreadable files raise FatalIOError.
 */
class ShotListIO
{
public:
    static std::vector<Shot> parseShots(const nlohmann::json &doc);
    static std::vector<Shot> loadShots(const std::string &file_path);

    static nlohmann::json shotToJson(const Shot &shot);
    static Shot shotFromJson(const nlohmann::json &j);

    static nlohmann::json cameraToJson(const Camera &camera);
    static Camera cameraFromJson(const nlohmann::json &j);

    static nlohmann::json camerasToJson(const std::vector<Camera> &cameras);
    static std::vector<Camera> camerasFromJson(const nlohmann::json &doc);
};
