#pragma once

#include <chrono>
#include <yaml-cpp/yaml.h>
#include "core/generators.hpp"

/**
 * @brief Settings shared by the offline providers
 */
struct OfflineSettings
{
    // Simulated remote latency per call
    std::chrono::milliseconds latency{0};

    static OfflineSettings fromYaml(const YAML::Node &node);
};

/**
 * @brief Deterministic stand-ins for the remote generators
 *
 * They produce small placeholder artifacts derived only from their input, so
 * dry runs exercise the whole scheduling path (cache layout, ordering,
 * manifest) without any network access.
 */
class OfflineTextGenerator : public TextGenerator
{
public:
    explicit OfflineTextGenerator(OfflineSettings settings = OfflineSettings()) : settings_(settings) {}

    nlohmann::json selectReferencesAndPrompt(const FramePromptRequest &request) override;

private:
    OfflineSettings settings_;
};

class OfflineImageGenerator : public ImageGenerator
{
public:
    explicit OfflineImageGenerator(OfflineSettings settings = OfflineSettings()) : settings_(settings) {}

    GeneratedArtifact generateImage(const ImageRequest &request) override;

private:
    OfflineSettings settings_;
};

class OfflineVideoGenerator : public VideoGenerator
{
public:
    explicit OfflineVideoGenerator(OfflineSettings settings = OfflineSettings()) : settings_(settings) {}

    GeneratedArtifact generateVideo(const VideoRequest &request) override;

private:
    OfflineSettings settings_;
};

class OfflineFrameGrabber : public FrameGrabber
{
public:
    explicit OfflineFrameGrabber(OfflineSettings settings = OfflineSettings()) : settings_(settings) {}

    /**
     * @throws NotFoundError when the video does not exist
     */
    GeneratedArtifact grabLastFrame(const std::filesystem::path &video_path) override;

private:
    OfflineSettings settings_;
};
