#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "core/generation_errors.hpp"

/**
 * @brief How much a shot's composition changes between its first and last frame
 */
enum class VariationType
{
    SMALL,  // Single keyframe; the video is driven by the first frame only
    MEDIUM, // First and last frame
    LARGE   // First and last frame
};

/**
 * @brief Kind of artifact a scheduled task produces
 */
enum class ArtifactKind
{
    FIRST_FRAME,
    LAST_FRAME,
    SHOT_VIDEO
};

class VariationTypes
{
public:
    static std::string getName(VariationType type)
    {
        switch (type)
        {
        case VariationType::SMALL:
            return "small";
        case VariationType::MEDIUM:
            return "medium";
        case VariationType::LARGE:
            return "large";
        default:
            return "unknown";
        }
    }

    /**
     * @brief Convert string to VariationType
     * @throws ValidationError for anything but small/medium/large
     */
    static VariationType fromString(const std::string &type_str)
    {
        if (type_str == "small" || type_str == "SMALL")
            return VariationType::SMALL;
        else if (type_str == "medium" || type_str == "MEDIUM")
            return VariationType::MEDIUM;
        else if (type_str == "large" || type_str == "LARGE")
            return VariationType::LARGE;
        throw ValidationError("Unknown variation type: " + type_str);
    }

    /**
     * @brief Whether a shot of this variation type needs a last-frame artifact
     */
    static bool requiresLastFrame(VariationType type)
    {
        return type != VariationType::SMALL;
    }
};

class ArtifactKinds
{
public:
    static std::string getName(ArtifactKind kind)
    {
        switch (kind)
        {
        case ArtifactKind::FIRST_FRAME:
            return "first_frame";
        case ArtifactKind::LAST_FRAME:
            return "last_frame";
        case ArtifactKind::SHOT_VIDEO:
            return "shot_video";
        default:
            return "unknown";
        }
    }

    static ArtifactKind fromString(const std::string &kind_str)
    {
        if (kind_str == "first_frame")
            return ArtifactKind::FIRST_FRAME;
        else if (kind_str == "last_frame")
            return ArtifactKind::LAST_FRAME;
        else if (kind_str == "shot_video" || kind_str == "video")
            return ArtifactKind::SHOT_VIDEO;
        throw ValidationError("Unknown artifact kind: " + kind_str);
    }

    static bool isFrame(ArtifactKind kind)
    {
        return kind == ArtifactKind::FIRST_FRAME || kind == ArtifactKind::LAST_FRAME;
    }
};

/**
 * @brief One narrative beat, as decomposed by the upstream script stages
 *
 * The camera hints are optional; when absent CameraTreeBuilder decides
 * camera membership and parentage itself.
 */
struct Shot
{
    int idx = 0;
    std::string visual_desc;
    std::string ff_desc;
    std::string lf_desc;
    std::string motion_desc;
    std::string audio_desc;
    VariationType variation_type = VariationType::SMALL;
    std::vector<std::string> reference_image_paths;

    // Camera-relationship hints
    std::optional<int> cam_idx;
    std::optional<int> parent_cam_idx;
    std::optional<int> parent_shot_idx;
    std::optional<ArtifactKind> parent_frame;
    std::optional<bool> is_parent_fully_covers_child;
    std::optional<std::string> missing_info;

    bool requiresLastFrame() const { return VariationTypes::requiresLastFrame(variation_type); }
};

/**
 * @brief A group of shots filmed from one vantage point
 */
struct Camera
{
    int idx = 0;
    std::vector<int> active_shot_idxs;
    std::optional<int> parent_cam_idx;
    std::optional<int> parent_shot_idx;
    ArtifactKind parent_frame = ArtifactKind::FIRST_FRAME;
    std::optional<bool> is_parent_fully_covers_child;
    std::optional<std::string> missing_info;

    bool isRoot() const { return !parent_cam_idx.has_value(); }
    int leadingShotIdx() const { return active_shot_idxs.front(); }
};

/**
 * @brief Identity of one schedulable unit of work
 */
struct TaskId
{
    int shot_idx = 0;
    ArtifactKind kind = ArtifactKind::FIRST_FRAME;

    bool operator==(const TaskId &other) const
    {
        return shot_idx == other.shot_idx && kind == other.kind;
    }
    bool operator!=(const TaskId &other) const { return !(*this == other); }
    bool operator<(const TaskId &other) const
    {
        if (shot_idx != other.shot_idx)
            return shot_idx < other.shot_idx;
        return static_cast<int>(kind) < static_cast<int>(other.kind);
    }

    std::string toString() const
    {
        return "shot " + std::to_string(shot_idx) + "/" + ArtifactKinds::getName(kind);
    }
};

/**
 * @brief Output of a remote generator: opaque bytes plus a format tag
 */
struct GeneratedArtifact
{
    std::vector<uint8_t> data;
    std::string format;

    GeneratedArtifact() = default;
    GeneratedArtifact(const std::vector<uint8_t> &d, const std::string &f = "")
        : data(d), format(f) {}

    static GeneratedArtifact fromString(const std::string &text, const std::string &f)
    {
        return GeneratedArtifact(std::vector<uint8_t>(text.begin(), text.end()), f);
    }

    bool empty() const { return data.empty(); }
};
