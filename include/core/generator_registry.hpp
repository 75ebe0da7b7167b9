#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>
#include "core/generators.hpp"

enum class GeneratorCapability
{
    TEXT,
    IMAGE,
    VIDEO,
    FRAME_GRABBER
};

class GeneratorCapabilities
{
public:
    static std::string getName(GeneratorCapability capability)
    {
        switch (capability)
        {
        case GeneratorCapability::TEXT:
            return "text";
        case GeneratorCapability::IMAGE:
            return "image";
        case GeneratorCapability::VIDEO:
            return "video";
        case GeneratorCapability::FRAME_GRABBER:
            return "frame_grabber";
        default:
            return "unknown";
        }
    }
};

/**
 * @brief Provider name -> factory map, one table per capability
 *
 * Resolved once at startup from the provider names in the configuration.
 * Factories receive the provider's YAML section so they can read their own
 * settings (endpoints, model names, simulated latency...).
 */
class GeneratorRegistry
{
public:
    using TextFactory = std::function<std::shared_ptr<TextGenerator>(const YAML::Node &)>;
    using ImageFactory = std::function<std::shared_ptr<ImageGenerator>(const YAML::Node &)>;
    using VideoFactory = std::function<std::shared_ptr<VideoGenerator>(const YAML::Node &)>;
    using FrameGrabberFactory = std::function<std::shared_ptr<FrameGrabber>(const YAML::Node &)>;

    // Registry with the built-in "offline" providers
    static GeneratorRegistry withBuiltins();

    void registerText(const std::string &provider, TextFactory factory);
    void registerImage(const std::string &provider, ImageFactory factory);
    void registerVideo(const std::string &provider, VideoFactory factory);
    void registerFrameGrabber(const std::string &provider, FrameGrabberFactory factory);

    /**
     * @throws ConfigError for an unregistered provider name
     */
    std::shared_ptr<TextGenerator> createText(const std::string &provider, const YAML::Node &settings = YAML::Node()) const;
    std::shared_ptr<ImageGenerator> createImage(const std::string &provider, const YAML::Node &settings = YAML::Node()) const;
    std::shared_ptr<VideoGenerator> createVideo(const std::string &provider, const YAML::Node &settings = YAML::Node()) const;
    std::shared_ptr<FrameGrabber> createFrameGrabber(const std::string &provider, const YAML::Node &settings = YAML::Node()) const;

    bool hasProvider(GeneratorCapability capability, const std::string &provider) const;
    std::vector<std::string> providers(GeneratorCapability capability) const;

private:
    std::map<std::string, TextFactory> text_factories_;
    std::map<std::string, ImageFactory> image_factories_;
    std::map<std::string, VideoFactory> video_factories_;
    std::map<std::string, FrameGrabberFactory> frame_grabber_factories_;
};
