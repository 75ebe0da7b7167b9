#pragma once

#include <filesystem>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "core/guarded_call.hpp"
#include "core/shot_types.hpp"

/**
 * @brief Remote generator capabilities the scheduler depends on
 *
 * Concrete providers live behind these interfaces and are created through
 * GeneratorRegistry. Implementations may throw TransientRemoteError for
 * retryable failures and ValidationError for malformed output; both are
 * retried by the GuardedCall wrapping every call.
 */

struct ReferenceImage
{
    std::string path;
    std::string description;
};

struct FramePromptRequest
{
    TaskId task;
    std::string frame_desc;
    std::vector<ReferenceImage> available_references;
};

/**
 * @brief Text model choosing reference images and writing the frame prompt
 *
 * Output document:
 * {
 *   "reference_image_path_and_text_pairs": [[path, description], ...],
 *   "text_prompt": "..."
 * }
 */
class TextGenerator
{
public:
    virtual ~TextGenerator() = default;
    virtual nlohmann::json selectReferencesAndPrompt(const FramePromptRequest &request) = 0;
};

struct ImageRequest
{
    std::string prompt;
    std::vector<std::string> reference_image_paths;
    std::string size = "1600x900";
};

class ImageGenerator
{
public:
    virtual ~ImageGenerator() = default;
    virtual GeneratedArtifact generateImage(const ImageRequest &request) = 0;
};

struct VideoRequest
{
    std::string prompt;
    // Empty: text to video; one: first frame; two: first and last frame
    std::vector<std::string> reference_image_paths;
    int duration_seconds = 8;
};

class VideoGenerator
{
public:
    virtual ~VideoGenerator() = default;
    virtual GeneratedArtifact generateVideo(const VideoRequest &request) = 0;
};

/**
 * @brief Pulls the closing frame out of a rendered transition video
 */
class FrameGrabber
{
public:
    virtual ~FrameGrabber() = default;
    virtual GeneratedArtifact grabLastFrame(const std::filesystem::path &video_path) = 0;
};

/**
 * @brief Resolved generators plus the guard (limiter + retry) of each service class
 */
struct GeneratorSuite
{
    std::shared_ptr<TextGenerator> text;
    std::shared_ptr<ImageGenerator> image;
    std::shared_ptr<VideoGenerator> video;
    std::shared_ptr<FrameGrabber> frame_grabber;

    std::shared_ptr<GuardedCall> text_guard;
    std::shared_ptr<GuardedCall> image_guard;
    std::shared_ptr<GuardedCall> video_guard;
    std::shared_ptr<GuardedCall> frame_guard;

    /**
     * @throws ConfigError when a generator or guard is missing
     */
    void validate() const;
};
